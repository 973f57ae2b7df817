#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

// Incremental reader over a request body.
class BodyReader {
public:
    virtual ~BodyReader() = default;
    // >0 bytes read, 0 at end of body, -1 on error.
    virtual long read(char* buf, std::size_t n) = 0;
};

// Decodes Content-Length or chunked framing on top of a raw byte source
// (the socket). Bytes already received with the headers go in `prefetched`.
class HttpBodyReader : public BodyReader {
public:
    using RawRead = std::function<long(char*, std::size_t)>;

    enum class Framing { None, Length, Chunked };

    HttpBodyReader(RawRead raw, std::string prefetched, Framing framing, uint64_t content_length = 0);

    long read(char* buf, std::size_t n) override;

    // The connection broke or the framing was invalid (as opposed to a clean end).
    bool failed() const { return failed_; }

private:
    RawRead raw_;
    std::string pre_;
    std::size_t pre_pos_ = 0;
    Framing framing_;
    uint64_t remaining_;        // in the body (Length) or current chunk (Chunked)
    bool done_ = false;
    bool failed_ = false;
    bool in_chunk_ = false;

    long raw_read(char* buf, std::size_t n);
    bool raw_line(std::string& line);
    bool start_chunk();
    long fail();
};
