#include "dispatch_pipeline.hpp"
#include "utils.hpp"
#include <utility>

DispatchPipeline::DispatchPipeline(FrameHandoff& handoff, TranscoderSink& live, CancelToken& cancel)
    : handoff_(handoff), live_(live), cancel_(cancel) {}

DispatchPipeline::Stats DispatchPipeline::stats() const {
    Stats s;
    s.received = received_;
    s.rejected = rejected_;
    s.archive_queued = archive_queued_;
    s.archive_dropped = archive_dropped_;
    s.live_forwarded = live_forwarded_;
    return s;
}

DispatchPipeline::Admit DispatchPipeline::admit(const IncomingFrame& in) {
    received_++;

    if (!in.has_timestamp) {
        log_msg("Multipart part missing X-Client-Timestamp header.");
        rejected_++;
        return Admit::Rejected;
    }
    Frame frame;
    if (!parse_millis(in.timestamp, frame.timestamp_ms)) {
        log_msg("Invalid X-Client-Timestamp '%s', dropping frame.", in.timestamp.c_str());
        rejected_++;
        return Admit::Rejected;
    }
    frame.data = in.data;

    // 1) archive copy: never wait for the writer
    Admit result = Admit::Forwarded;
    switch (handoff_.try_push(std::move(frame))) {
    case FrameHandoff::PushResult::Queued:
        archive_queued_++;
        break;
    case FrameHandoff::PushResult::Full:
        log_msg("Archive channel is full. Dropping frame %s for archival to prioritize live stream.",
                in.timestamp.c_str());
        archive_dropped_++;
        result = Admit::ArchiveDropped;
        break;
    case FrameHandoff::PushResult::Closed:
        log_debug("Archive closed, frame %s not archived.", in.timestamp.c_str());
        archive_dropped_++;
        result = Admit::ArchiveDropped;
        break;
    }

    // 2) live copy: blocking
    if (!live_.write(in.data.data(), in.data.size())) return Admit::LiveFailed;
    live_forwarded_++;
    return result;
}

void DispatchPipeline::run(FrameSource& source) {
    IncomingFrame in;
    while (!cancel_.cancelled()) {
        auto n = source.next(in);
        if (n == FrameSource::Next::End) break;
        if (n == FrameSource::Next::Error) {
            if (!cancel_.cancelled()) log_msg("Error reading multipart part, ending stream.");
            break;
        }
        if (admit(in) == Admit::LiveFailed) break;
    }
    // Signal the archiver that no more frames are coming.
    handoff_.close();
}
