#pragma once
#include "config.hpp"
#include "frame.hpp"
#include "frame_handoff.hpp"
#include "tar_format.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <memory>
#include <string>

// Sole writer of a stream's archive segments. Frames arrive only through the
// hand-off; the open segment is private to the thread running run().
class ArchiveWriter {
public:
    enum class State { NoSegment, SegmentOpen, Closed };

    struct Stats {
        std::size_t segments_created = 0;
        std::size_t segments_finalized = 0;
        std::size_t frames_written = 0;
        std::size_t frames_skipped = 0;
        bool halted = false;   // stopped early on a segment creation failure
    };

    ArchiveWriter(std::string dir, std::string stream_name,
                  int64_t window_ms = cfg::ARCHIVE_WINDOW_MS);
    virtual ~ArchiveWriter();
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // Consumes frames until the hand-off is closed or cancelled, then
    // finalizes the open segment.
    void run(FrameHandoff& handoff);

    State state() const { return state_; }
    Stats stats() const;

protected:
    // Output for a new segment file; nullptr if it cannot be created.
    virtual std::unique_ptr<std::ostream> open_segment_stream(const std::string& path);

private:
    const std::string dir_;
    const std::string stream_;
    const int64_t window_ms_;

    std::atomic<State> state_{State::NoSegment};
    int64_t segment_start_ = -1;
    std::string segment_path_;
    std::unique_ptr<std::ostream> out_;
    std::unique_ptr<TarWriter> tar_;

    std::atomic<std::size_t> segments_created_{0};
    std::atomic<std::size_t> segments_finalized_{0};
    std::atomic<std::size_t> frames_written_{0};
    std::atomic<std::size_t> frames_skipped_{0};
    std::atomic<bool> halted_{false};

    bool handle_frame(const Frame& frame);
    bool open_segment(int64_t start_ms);
    // Flush and close the open segment, if any.
    void finish_segment();
};
