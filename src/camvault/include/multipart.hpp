#pragma once
#include "frame_source.hpp"
#include "http_body.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

// Extracts the boundary from a "multipart/...; boundary=..." Content-Type.
bool parse_multipart_boundary(const std::string& content_type, std::string& boundary);

struct MultipartPart {
    std::unordered_map<std::string, std::string> headers;   // lower-case names
    std::vector<unsigned char> body;

    const std::string* header(const std::string& lower_name) const;
};

// Streaming multipart parser; holds at most one part in memory.
class MultipartReader {
public:
    enum class Next { Part, End, Error };

    MultipartReader(BodyReader& body, const std::string& boundary,
                    std::size_t max_part_bytes = 16u << 20);

    Next next_part(MultipartPart& part);
    const std::string& error() const { return error_; }

private:
    BodyReader& body_;
    const std::string delim_;        // "--" + boundary
    const std::size_t max_part_;
    std::string buf_;
    std::size_t pos_ = 0;
    bool eof_ = false;
    bool started_ = false;
    bool finished_ = false;
    std::string error_;

    bool fill();
    bool ensure(std::size_t n);
    bool read_line(std::string& line);
    bool after_delimiter(bool& closing);
    Next fail(const std::string& why);
};

// Frame source over a multipart upload; the capture time comes from each
// part's X-Client-Timestamp header.
class MultipartFrameSource : public FrameSource {
public:
    MultipartFrameSource(BodyReader& body, const std::string& boundary);
    Next next(IncomingFrame& out) override;

private:
    MultipartReader reader_;
};
