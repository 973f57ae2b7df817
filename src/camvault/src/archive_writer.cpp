#include "archive_writer.hpp"
#include "segment_store.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <utility>

ArchiveWriter::ArchiveWriter(std::string dir, std::string stream_name, int64_t window_ms)
    : dir_(std::move(dir)), stream_(std::move(stream_name)), window_ms_(window_ms) {}

ArchiveWriter::~ArchiveWriter() {
    finish_segment();
}

ArchiveWriter::Stats ArchiveWriter::stats() const {
    Stats s;
    s.segments_created = segments_created_;
    s.segments_finalized = segments_finalized_;
    s.frames_written = frames_written_;
    s.frames_skipped = frames_skipped_;
    s.halted = halted_;
    return s;
}

std::unique_ptr<std::ostream> ArchiveWriter::open_segment_stream(const std::string& path) {
    auto f = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!f->is_open()) return nullptr;
    return f;
}

void ArchiveWriter::run(FrameHandoff& handoff) {
    log_msg("Starting archive writer for stream %s", stream_.c_str());

    Frame frame;
    while (state_ != State::Closed) {
        auto r = handoff.pop(frame);
        if (r != FrameHandoff::PopResult::Frame) {
            if (r == FrameHandoff::PopResult::Cancelled)
                log_debug("ARCHIVER: %s cancelled", stream_.c_str());
            break;
        }
        if (!handle_frame(frame)) {
            log_msg("ARCHIVER: Halting due to file creation failure.");
            halted_ = true;
            break;
        }
    }

    finish_segment();
    state_ = State::Closed;
    log_msg("Archive writer for stream %s stopped.", stream_.c_str());
}

bool ArchiveWriter::handle_frame(const Frame& frame) {
    const int64_t t = frame.timestamp_ms;

    // First frame, or the window of the open segment has elapsed.
    if (state_ == State::NoSegment || t - segment_start_ >= window_ms_) {
        if (!open_segment(t)) return false;
    }

    const std::string name = frame_entry_name(t);
    switch (tar_->add_file(name, frame.data.data(), frame.data.size(), (int64_t)std::time(nullptr))) {
    case TarWriter::Status::Ok:
        // readers scan the open segment, so every stored frame goes to disk now
        out_->flush();
        if (!*out_) {
            log_msg("ARCHIVER: Failed to flush %s", segment_path_.c_str());
            out_->clear();
        }
        frames_written_++;
        break;
    case TarWriter::Status::HeaderFailed:
        log_msg("ARCHIVER: Failed to write tar header for %s", name.c_str());
        frames_skipped_++;
        break;
    case TarWriter::Status::DataFailed:
        log_msg("ARCHIVER: Failed to write frame data for %s", name.c_str());
        frames_skipped_++;
        break;
    }
    return true;
}

bool ArchiveWriter::open_segment(int64_t start_ms) {
    finish_segment();

    std::string path = dir_ + "/" + segment_file_name(stream_, start_ms);
    out_ = open_segment_stream(path);
    if (!out_) {
        log_msg("ARCHIVER: Failed to create new tar file %s: %s", path.c_str(), strerror(errno));
        state_ = State::Closed;
        return false;
    }
    tar_ = std::make_unique<TarWriter>(*out_);
    segment_start_ = start_ms;
    segment_path_ = path;
    state_ = State::SegmentOpen;
    segments_created_++;
    log_msg("ARCHIVER: Created new archive file: %s", path.c_str());
    return true;
}

void ArchiveWriter::finish_segment() {
    if (state_ != State::SegmentOpen) return;
    if (!tar_->finish())
        log_msg("ARCHIVER: Failed to finalize %s", segment_path_.c_str());
    tar_.reset();
    out_.reset();
    state_ = State::NoSegment;
    segments_finalized_++;
    log_debug("ARCHIVER: Closed %s", segment_path_.c_str());
}
