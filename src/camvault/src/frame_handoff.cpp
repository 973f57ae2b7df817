#include "frame_handoff.hpp"
#include <utility>

FrameHandoff::FrameHandoff(std::size_t capacity)
    : capacity_(capacity) {}

FrameHandoff::PushResult FrameHandoff::try_push(Frame frame) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_ || cancelled_) return PushResult::Closed;
        if (q_.size() >= capacity_) return PushResult::Full;
        q_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return PushResult::Queued;
}

FrameHandoff::PopResult FrameHandoff::pop(Frame& out) {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait(lk, [&] { return !q_.empty() || closed_ || cancelled_; });
    if (!q_.empty()) {
        out = std::move(q_.front());
        q_.pop_front();
        return PopResult::Frame;
    }
    return cancelled_ ? PopResult::Cancelled : PopResult::Closed;
}

void FrameHandoff::close() {
    {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
    }
    cv_.notify_all();
}

void FrameHandoff::cancel() {
    {
        std::lock_guard<std::mutex> lk(m_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

std::size_t FrameHandoff::size() const {
    std::lock_guard<std::mutex> lk(m_);
    return q_.size();
}

bool FrameHandoff::closed() const {
    std::lock_guard<std::mutex> lk(m_);
    return closed_;
}
