#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Point-in-time lookup over a stream's archive segments.
// Read-only; safe to call while the stream is still being written.
class FrameRetriever {
public:
    enum class Status { Found, NotFound, ReadError };

    struct Result {
        Status status = Status::NotFound;
        int64_t timestamp_ms = -1;          // of the returned frame
        std::vector<unsigned char> jpeg;
        std::string message;                // reason for NotFound / ReadError
    };

    // jpeg_root holds one directory per stream.
    explicit FrameRetriever(std::string jpeg_root);

    // Most recent frame with timestamp <= target_ms.
    Result find(const std::string& stream, int64_t target_ms) const;

    // Scan of one segment file; exposed for tests.
    static Result scan_segment(const std::string& path, int64_t target_ms);

private:
    std::string root_;
};
