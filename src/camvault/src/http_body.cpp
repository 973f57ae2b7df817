#include "http_body.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

HttpBodyReader::HttpBodyReader(RawRead raw, std::string prefetched, Framing framing, uint64_t content_length)
    : raw_(std::move(raw)), pre_(std::move(prefetched)), framing_(framing), remaining_(content_length) {
    if (framing_ == Framing::None || (framing_ == Framing::Length && remaining_ == 0)) done_ = true;
}

long HttpBodyReader::fail() {
    failed_ = true;
    done_ = true;
    return -1;
}

long HttpBodyReader::raw_read(char* buf, std::size_t n) {
    if (pre_pos_ < pre_.size()) {
        std::size_t k = std::min(n, pre_.size() - pre_pos_);
        std::memcpy(buf, pre_.data() + pre_pos_, k);
        pre_pos_ += k;
        return (long)k;
    }
    return raw_(buf, n);
}

bool HttpBodyReader::raw_line(std::string& line) {
    line.clear();
    char c;
    while (line.size() < 4096) {
        if (raw_read(&c, 1) != 1) return false;
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        line.push_back(c);
    }
    return false;
}

bool HttpBodyReader::start_chunk() {
    std::string line;
    if (!raw_line(line)) return false;
    auto semi = line.find(';');   // chunk extensions are ignored
    if (semi != std::string::npos) line.resize(semi);
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) line.pop_back();
    if (line.empty() || line.size() > 15) return false;

    uint64_t size = 0;
    for (char c : line) {
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else return false;
        size = (size << 4) | (uint64_t)d;
    }

    if (size == 0) {
        // trailer section ends with an empty line
        do {
            if (!raw_line(line)) return false;
        } while (!line.empty());
        done_ = true;
        return true;
    }
    remaining_ = size;
    in_chunk_ = true;
    return true;
}

long HttpBodyReader::read(char* buf, std::size_t n) {
    if (done_) return failed_ ? -1 : 0;
    if (n == 0) return 0;

    if (framing_ == Framing::Length) {
        long r = raw_read(buf, (std::size_t)std::min<uint64_t>(n, remaining_));
        if (r <= 0) return fail();    // connection ended before Content-Length bytes
        remaining_ -= (uint64_t)r;
        if (remaining_ == 0) done_ = true;
        return r;
    }

    // chunked
    if (!in_chunk_) {
        if (!start_chunk()) return fail();
        if (done_) return 0;
    }
    long r = raw_read(buf, (std::size_t)std::min<uint64_t>(n, remaining_));
    if (r <= 0) return fail();
    remaining_ -= (uint64_t)r;
    if (remaining_ == 0) {
        std::string crlf;
        if (!raw_line(crlf) || !crlf.empty()) return fail();
        in_chunk_ = false;
    }
    return r;
}
