#pragma once
#include "archive_writer.hpp"
#include "cancel_token.hpp"
#include "dispatch_pipeline.hpp"
#include "frame_handoff.hpp"
#include "frame_source.hpp"
#include "transcoder.hpp"
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

// One upload of one stream: a dispatch loop on the caller's thread feeding an
// archive writer thread and the live transcoder. Cancelling `cancel` kills the
// transcoder, unblocks the dispatch write and wakes the writer.
class IngestSession {
public:
    IngestSession(const std::string& stream, const std::string& jpeg_dir,
                  std::size_t handoff_capacity, int64_t window_ms,
                  TranscoderSink& live, CancelToken& cancel);
    ~IngestSession();
    IngestSession(const IngestSession&) = delete;
    IngestSession& operator=(const IngestSession&) = delete;

    void start();
    void dispatch(FrameSource& source);
    // Closes the hand-off, ends the live input and waits for both consumers.
    // Returns the transcoder's result. Idempotent.
    bool finish();

    DispatchPipeline::Stats dispatch_stats() const { return pipeline_.stats(); }
    ArchiveWriter::Stats archive_stats() const { return writer_.stats(); }

private:
    std::string stream_;
    TranscoderSink& live_;
    CancelToken& cancel_;
    FrameHandoff handoff_;
    ArchiveWriter writer_;
    DispatchPipeline pipeline_;
    std::thread writer_th_;
    CancelCallback on_cancel_;
    bool finished_ = false;
    bool live_ok_ = false;
};

// Stream names with an ingestion session in progress; one session per name.
class ActiveStreams {
public:
    bool acquire(const std::string& stream);
    void release(const std::string& stream);

private:
    std::mutex m_;
    std::unordered_set<std::string> names_;
};
