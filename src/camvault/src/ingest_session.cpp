#include "ingest_session.hpp"
#include "utils.hpp"

IngestSession::IngestSession(const std::string& stream, const std::string& jpeg_dir,
                             std::size_t handoff_capacity, int64_t window_ms,
                             TranscoderSink& live, CancelToken& cancel)
    : stream_(stream)
    , live_(live)
    , cancel_(cancel)
    , handoff_(handoff_capacity)
    , writer_(jpeg_dir, stream, window_ms)
    , pipeline_(handoff_, live, cancel)
    , on_cancel_(cancel, [this] {
          live_.cancel();
          handoff_.cancel();
      }) {}

IngestSession::~IngestSession() {
    finish();
}

void IngestSession::start() {
    writer_th_ = std::thread([this] { writer_.run(handoff_); });
}

void IngestSession::dispatch(FrameSource& source) {
    pipeline_.run(source);
}

bool IngestSession::finish() {
    if (finished_) return live_ok_;
    finished_ = true;

    handoff_.close();
    live_ok_ = live_.finish();
    if (writer_th_.joinable()) writer_th_.join();

    auto d = pipeline_.stats();
    auto a = writer_.stats();
    log_msg("Finished processing stream for %s (received %zu, rejected %zu, archive drops %zu, archived %zu in %zu segments%s)",
            stream_.c_str(), d.received, d.rejected, d.archive_dropped, a.frames_written,
            a.segments_created, cancel_.cancelled() ? ", cancelled" : "");
    return live_ok_;
}

bool ActiveStreams::acquire(const std::string& stream) {
    std::lock_guard<std::mutex> lk(m_);
    return names_.insert(stream).second;
}

void ActiveStreams::release(const std::string& stream) {
    std::lock_guard<std::mutex> lk(m_);
    names_.erase(stream);
}
