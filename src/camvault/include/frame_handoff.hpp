#pragma once
#include "frame.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Bounded single-producer/single-consumer queue between the dispatch
// pipeline and the archive writer. The producer never blocks.
class FrameHandoff {
public:
    enum class PushResult { Queued, Full, Closed };
    enum class PopResult { Frame, Closed, Cancelled };

    explicit FrameHandoff(std::size_t capacity);

    PushResult try_push(Frame frame);

    // Blocks until a frame is queued, the hand-off is closed, or cancel() is called.
    // Frames already queued are still handed out after close() or cancel().
    PopResult pop(Frame& out);

    // Both are idempotent and may be called in any order.
    void close();
    void cancel();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    bool closed() const;

private:
    const std::size_t capacity_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<Frame> q_;
    bool closed_ = false;
    bool cancelled_ = false;
};
