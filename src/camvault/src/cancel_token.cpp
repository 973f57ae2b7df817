#include "cancel_token.hpp"

CancelToken::~CancelToken() {
    if (parent_) parent_->remove_callback(parent_cb_);
}

void CancelToken::link_to(CancelToken& parent) {
    if (parent_) parent_->remove_callback(parent_cb_);
    parent_ = &parent;
    parent_cb_ = parent.on_cancel([this] { cancel(); });
}

void CancelToken::cancel() {
    std::vector<std::pair<int, Callback>> cbs;
    {
        std::lock_guard<std::mutex> lk(m_);
        if (cancelled_) return;
        cancelled_ = true;
        running_ = true;
        runner_ = std::this_thread::get_id();
        cbs.swap(callbacks_);
    }
    for (auto& p : cbs) {
        if (p.second) p.second();
    }
    {
        std::lock_guard<std::mutex> lk(m_);
        running_ = false;
    }
    done_cv_.notify_all();
}

bool CancelToken::cancelled() const {
    std::lock_guard<std::mutex> lk(m_);
    return cancelled_;
}

int CancelToken::on_cancel(Callback cb) {
    std::unique_lock<std::mutex> lk(m_);
    int id = next_id_++;
    if (cancelled_) {
        lk.unlock();
        if (cb) cb();
        return id;
    }
    callbacks_.push_back({id, std::move(cb)});
    return id;
}

void CancelToken::remove_callback(int id) {
    std::unique_lock<std::mutex> lk(m_);
    for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
        if (it->first == id) { callbacks_.erase(it); return; }
    }
    // Already handed to a running cancel(); wait for it unless we are that thread.
    if (running_ && runner_ != std::this_thread::get_id()) {
        done_cv_.wait(lk, [&] { return !running_; });
    }
}
