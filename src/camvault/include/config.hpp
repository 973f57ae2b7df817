#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace cfg {
// Network
inline constexpr int SERVER_PORT = 8080;

// Storage: <DATA_ROOT>/jpeg/<stream> holds archive segments,
// <DATA_ROOT>/hls/<stream> holds the transcoder output.
inline const std::string DATA_ROOT = "/mnt/nfs/streams";
inline const std::string JPEG_SUBDIR = "jpeg";
inline const std::string HLS_SUBDIR = "hls";

// Archive
inline constexpr int64_t ARCHIVE_WINDOW_MS = 60000;   // new segment every 60 s
inline constexpr std::size_t HANDOFF_CAPACITY = 300;  // ~60 s of frames at 5 fps
inline constexpr int SEGMENT_START_DIGITS = 13;       // zero padding in segment names
inline const std::string SEGMENT_SUFFIX = ".tar";
inline const std::string FRAME_SUFFIX = ".jpg";

// Ingestion
inline const std::string TIMESTAMP_HEADER = "X-Client-Timestamp";

// Transcoder (ffmpeg -> HLS)
inline const std::string FFMPEG_BIN = "ffmpeg";
inline constexpr int TRANSCODE_FPS = 5;
inline constexpr int HLS_SEGMENT_SECONDS = 2;
inline constexpr int HLS_LIST_SIZE = 5;
}

// Runtime settings, defaults from cfg and overridden on the command line.
struct ServiceOptions {
    int port = cfg::SERVER_PORT;
    std::string data_root = cfg::DATA_ROOT;
    int64_t window_ms = cfg::ARCHIVE_WINDOW_MS;
    std::size_t handoff_capacity = cfg::HANDOFF_CAPACITY;
    std::string ffmpeg_bin = cfg::FFMPEG_BIN;
    bool verbose = false;

    std::string jpeg_dir(const std::string& stream) const {
        return data_root + "/" + cfg::JPEG_SUBDIR + "/" + stream;
    }
    std::string hls_dir(const std::string& stream) const {
        return data_root + "/" + cfg::HLS_SUBDIR + "/" + stream;
    }
};
