#include "multipart.hpp"
#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

static std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
    return s.substr(b, e - b);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

bool parse_multipart_boundary(const std::string& content_type, std::string& boundary) {
    auto semi = content_type.find(';');
    std::string media = lower(trim(content_type.substr(0, semi)));
    if (media.compare(0, 10, "multipart/") != 0 || media.size() == 10) return false;

    while (semi != std::string::npos) {
        auto next = content_type.find(';', semi + 1);
        std::string param = content_type.substr(semi + 1, next == std::string::npos ? std::string::npos : next - semi - 1);
        semi = next;
        auto eq = param.find('=');
        if (eq == std::string::npos) continue;
        if (lower(trim(param.substr(0, eq))) != "boundary") continue;
        std::string v = trim(param.substr(eq + 1));
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);
        if (v.empty() || v.size() > 70) return false;
        boundary = v;
        return true;
    }
    return false;
}

const std::string* MultipartPart::header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? nullptr : &it->second;
}

// ---- MultipartReader ----

MultipartReader::MultipartReader(BodyReader& body, const std::string& boundary, std::size_t max_part_bytes)
    : body_(body), delim_("--" + boundary), max_part_(max_part_bytes) {}

MultipartReader::Next MultipartReader::fail(const std::string& why) {
    if (error_.empty()) error_ = why;
    finished_ = true;
    return Next::Error;
}

bool MultipartReader::fill() {
    if (eof_) return false;
    if (pos_ > 0 && pos_ * 2 >= buf_.size()) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
    char tmp[64 * 1024];
    long r = body_.read(tmp, sizeof(tmp));
    if (r <= 0) {
        if (r < 0) error_ = "request body read failed";
        eof_ = true;
        return false;
    }
    buf_.append(tmp, (std::size_t)r);
    return true;
}

bool MultipartReader::ensure(std::size_t n) {
    while (buf_.size() - pos_ < n) {
        if (!fill()) return false;
    }
    return true;
}

bool MultipartReader::read_line(std::string& line) {
    std::size_t nl;
    while ((nl = buf_.find('\n', pos_)) == std::string::npos) {
        if (buf_.size() - pos_ > 8192) return false;
        if (!fill()) return false;
    }
    line = buf_.substr(pos_, nl - pos_);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    pos_ = nl + 1;
    return true;
}

bool MultipartReader::after_delimiter(bool& closing) {
    closing = false;
    if (ensure(2) && buf_.compare(pos_, 2, "--") == 0) {
        closing = true;
        pos_ += 2;
        // the epilogue is ignored and may end without CRLF
        std::string rest, err = error_;
        read_line(rest);
        error_ = err;
        return true;
    }
    std::string rest;
    return read_line(rest) && trim(rest).empty();
}

MultipartReader::Next MultipartReader::next_part(MultipartPart& part) {
    if (finished_) return error_.empty() ? Next::End : Next::Error;

    part.headers.clear();
    part.body.clear();

    if (!started_) {
        // skip the preamble up to the first delimiter line
        std::string line;
        while (true) {
            if (!read_line(line)) return fail(error_.empty() ? "no multipart boundary found" : error_);
            line = trim(line);
            if (line == delim_) break;
            if (line == delim_ + "--") { finished_ = true; return Next::End; }
        }
        started_ = true;
    }

    // headers
    std::string line;
    while (true) {
        if (!read_line(line)) return fail(error_.empty() ? "unexpected EOF in part headers" : error_);
        if (line.empty()) break;
        auto c = line.find(':');
        if (c == std::string::npos) return fail("malformed part header");
        part.headers[lower(trim(line.substr(0, c)))] = trim(line.substr(c + 1));
    }

    // body, up to CRLF + delimiter
    const std::string marker = "\r\n" + delim_;
    while (true) {
        auto idx = buf_.find(marker, pos_);
        if (idx != std::string::npos) {
            part.body.insert(part.body.end(), buf_.begin() + pos_, buf_.begin() + idx);
            pos_ = idx + marker.size();
            break;
        }
        std::size_t avail = buf_.size() - pos_;
        if (avail >= marker.size()) {
            std::size_t take = avail - (marker.size() - 1);
            part.body.insert(part.body.end(), buf_.begin() + pos_, buf_.begin() + pos_ + take);
            pos_ += take;
        }
        if (part.body.size() > max_part_) return fail("multipart part too large");
        if (!fill()) return fail(error_.empty() ? "unexpected EOF in part body" : error_);
    }
    if (part.body.size() > max_part_) return fail("multipart part too large");

    bool closing = false;
    if (!after_delimiter(closing)) return fail(error_.empty() ? "malformed multipart delimiter" : error_);
    if (closing) finished_ = true;
    return Next::Part;
}

// ---- MultipartFrameSource ----

MultipartFrameSource::MultipartFrameSource(BodyReader& body, const std::string& boundary)
    : reader_(body, boundary) {}

FrameSource::Next MultipartFrameSource::next(IncomingFrame& out) {
    MultipartPart part;
    switch (reader_.next_part(part)) {
    case MultipartReader::Next::End:
        return Next::End;
    case MultipartReader::Next::Error:
        return Next::Error;
    case MultipartReader::Next::Part:
        break;
    }
    const std::string* ts = part.header(lower(cfg::TIMESTAMP_HEADER));
    out.has_timestamp = ts != nullptr && !ts->empty();
    out.timestamp = ts ? *ts : std::string();
    out.data = std::move(part.body);
    return Next::Frame;
}
