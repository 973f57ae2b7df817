#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

// One-shot cancellation signal for an ingestion session.
// Callbacks registered with on_cancel() run once, on the thread that calls cancel().
// A token can be linked to a parent so cancelling the parent cancels it too.
class CancelToken {
public:
    using Callback = std::function<void()>;

    CancelToken() = default;
    ~CancelToken();
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void link_to(CancelToken& parent);

    void cancel();
    bool cancelled() const;

    // Runs cb right away if already cancelled. Returns an id for remove_callback().
    int on_cancel(Callback cb);
    // After this returns the callback is not running and will never run.
    void remove_callback(int id);

private:
    mutable std::mutex m_;
    std::condition_variable done_cv_;
    bool cancelled_ = false;
    bool running_ = false;
    std::thread::id runner_;
    int next_id_ = 1;
    std::vector<std::pair<int, Callback>> callbacks_;

    CancelToken* parent_ = nullptr;
    int parent_cb_ = 0;
};

// Scoped on_cancel() registration.
class CancelCallback {
public:
    CancelCallback(CancelToken& token, CancelToken::Callback cb)
        : token_(token), id_(token.on_cancel(std::move(cb))) {}
    ~CancelCallback() { token_.remove_callback(id_); }
    CancelCallback(const CancelCallback&) = delete;
    CancelCallback& operator=(const CancelCallback&) = delete;

private:
    CancelToken& token_;
    int id_;
};
