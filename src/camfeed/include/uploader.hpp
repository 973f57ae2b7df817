#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct StreamUrl {
    std::string host;
    std::string port = "80";
    std::string path = "/";
};

// "http://host[:port][/path]"; https is not supported.
bool parse_stream_url(const std::string& url, StreamUrl& out);

// Streams JPEG frames as one chunked multipart/form-data POST.
class MultipartUploader {
public:
    MultipartUploader();
    ~MultipartUploader();
    MultipartUploader(const MultipartUploader&) = delete;
    MultipartUploader& operator=(const MultipartUploader&) = delete;

    bool open(const StreamUrl& url);
    bool send_frame(const std::vector<unsigned char>& jpeg, int64_t timestamp_ms);
    // Writes the closing boundary and the last chunk, then reads the status line.
    // Returns the HTTP status, or -1 if the exchange failed.
    int finish();
    void close();

    const std::string& boundary() const { return boundary_; }

    // Chunk framing for `part`, exposed for tests.
    static std::string chunk(const std::string& part);
    static std::string part_header(const std::string& boundary, int64_t timestamp_ms, bool first);

private:
    int fd_ = -1;
    std::string boundary_;
    bool first_ = true;

    bool send_all(const std::string& data);
};
