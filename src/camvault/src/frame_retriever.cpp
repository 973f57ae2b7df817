#include "frame_retriever.hpp"
#include "frame.hpp"
#include "segment_store.hpp"
#include "tar_format.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

FrameRetriever::FrameRetriever(std::string jpeg_root)
    : root_(std::move(jpeg_root)) {}

FrameRetriever::Result FrameRetriever::find(const std::string& stream, int64_t target_ms) const {
    Result res;
    std::vector<SegmentInfo> segments;
    switch (list_segments(root_ + "/" + stream, segments)) {
    case ListStatus::Ok:
        break;
    case ListStatus::NoStream:
        res.message = "No archive file found covering the given timestamp";
        return res;
    case ListStatus::Error:
        res.status = Status::ReadError;
        res.message = "Could not read stream directory";
        return res;
    }

    SegmentInfo seg;
    if (!select_segment(segments, target_ms, seg)) {
        res.message = "No archive file found covering the given timestamp";
        return res;
    }
    log_debug("lookup %s@%lld -> %s", stream.c_str(), (long long)target_ms, seg.path.c_str());
    return scan_segment(seg.path, target_ms);
}

FrameRetriever::Result FrameRetriever::scan_segment(const std::string& path, int64_t target_ms) {
    Result res;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log_msg("Failed to open tar file %s: %s", path.c_str(), strerror(errno));
        res.status = Status::ReadError;
        res.message = "Failed to open archive file";
        return res;
    }

    TarReader tar(in);
    TarEntry entry;
    bool have = false;
    while (true) {
        auto n = tar.next(entry);
        if (n == TarReader::Next::End) break;
        if (n == TarReader::Next::Error) {
            log_msg("Error reading tar header in %s: %s", path.c_str(), tar.error().c_str());
            res.status = Status::ReadError;
            res.message = "Failed to read archive file";
            res.jpeg.clear();
            return res;
        }
        if (!entry.regular()) continue;   // next() skips the payload

        int64_t ts = 0;
        if (!parse_frame_entry_name(entry.name, ts)) {
            log_msg("Warning: Could not parse timestamp from frame name %s in tar", entry.name.c_str());
            continue;
        }
        // Entries are in arrival order, so nothing after a newer frame can match.
        if (ts > target_ms) break;

        std::vector<unsigned char> data;
        if (!tar.read_data(data)) {
            log_msg("Error reading frame data for %s", entry.name.c_str());
            continue;
        }
        res.jpeg = std::move(data);
        res.timestamp_ms = ts;
        have = true;
    }

    if (have) {
        res.status = Status::Found;
    } else {
        res.message = "No image found in archive matching or preceding the timestamp";
    }
    return res;
}
