#pragma once
#include "cancel_token.hpp"
#include "frame_handoff.hpp"
#include "frame_source.hpp"
#include "transcoder.hpp"
#include <atomic>
#include <cstddef>

// Fans each uploaded frame out to the archive hand-off (never blocks, drops
// when full) and to the live transcoder (blocks, failure ends the session).
class DispatchPipeline {
public:
    enum class Admit { Forwarded, ArchiveDropped, Rejected, LiveFailed };

    struct Stats {
        std::size_t received = 0;
        std::size_t rejected = 0;
        std::size_t archive_queued = 0;
        std::size_t archive_dropped = 0;
        std::size_t live_forwarded = 0;
    };

    DispatchPipeline(FrameHandoff& handoff, TranscoderSink& live, CancelToken& cancel);

    Admit admit(const IncomingFrame& in);

    // Pulls frames until the source ends or fails, the live sink fails, or
    // the session is cancelled. Always closes the hand-off before returning.
    void run(FrameSource& source);

    Stats stats() const;

private:
    FrameHandoff& handoff_;
    TranscoderSink& live_;
    CancelToken& cancel_;

    std::atomic<std::size_t> received_{0};
    std::atomic<std::size_t> rejected_{0};
    std::atomic<std::size_t> archive_queued_{0};
    std::atomic<std::size_t> archive_dropped_{0};
    std::atomic<std::size_t> live_forwarded_{0};
};
