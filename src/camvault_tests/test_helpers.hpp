#pragma once
// Fixtures shared by the camvault unit tests.

#include "frame_handoff.hpp"
#include "frame_source.hpp"
#include "http_body.hpp"
#include "transcoder.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace testing_support
{

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class TempDir
{
public:
    TempDir()
    {
        std::random_device rd;
        path_ = (fs::temp_directory_path() / ("camvault_test_" + std::to_string(rd()) + std::to_string(rd())))
                    .string();
        fs::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const
    {
        return path_;
    }

private:
    std::string path_;
};

inline std::vector<unsigned char> bytes(const std::string& s)
{
    return std::vector<unsigned char>(s.begin(), s.end());
}

inline Frame make_frame(int64_t ts, const std::string& payload)
{
    Frame f;
    f.timestamp_ms = ts;
    f.data = bytes(payload);
    return f;
}

inline std::string payload_for(int64_t ts)
{
    return "jpeg-" + std::to_string(ts);
}

// Body served from memory in pieces of at most `step` bytes; optionally
// reports a broken connection after the data runs out.
class StringBody : public BodyReader
{
public:
    explicit StringBody(std::string data, std::size_t step = 7, bool fail_at_end = false)
        : data_(std::move(data)), step_(step), fail_at_end_(fail_at_end)
    {
    }

    long read(char* buf, std::size_t n) override
    {
        if (pos_ >= data_.size())
            return fail_at_end_ ? -1 : 0;
        std::size_t k = std::min({ n, step_, data_.size() - pos_ });
        std::memcpy(buf, data_.data() + pos_, k);
        pos_ += k;
        return (long)k;
    }

private:
    std::string data_;
    std::size_t step_;
    bool fail_at_end_;
    std::size_t pos_ = 0;
};

// Raw socket stand-in for HttpBodyReader.
inline HttpBodyReader::RawRead raw_from(std::string data, std::size_t step = 5)
{
    auto state = std::make_shared<std::pair<std::string, std::size_t>>(std::move(data), 0);
    return [state, step](char* buf, std::size_t n) -> long {
        auto& s = *state;
        if (s.second >= s.first.size())
            return 0;
        std::size_t k = std::min({ n, step, s.first.size() - s.second });
        std::memcpy(buf, s.first.data() + s.second, k);
        s.second += k;
        return (long)k;
    };
}

// Records everything written; can be told to fail after N writes.
class FakeTranscoder : public TranscoderSink
{
public:
    explicit FakeTranscoder(int fail_after = -1) : fail_after_(fail_after)
    {
    }

    bool write(const unsigned char* data, std::size_t size) override
    {
        std::lock_guard<std::mutex> lk(m_);
        if (cancelled_ || (fail_after_ >= 0 && (int)writes_.size() >= fail_after_))
            return false;
        writes_.emplace_back(data, data + size);
        return true;
    }

    bool finish() override
    {
        finished_ = true;
        return !cancelled_;
    }

    void cancel() override
    {
        cancelled_ = true;
    }

    std::vector<std::vector<unsigned char>> writes() const
    {
        std::lock_guard<std::mutex> lk(m_);
        return writes_;
    }

    std::atomic<bool> finished_{ false };
    std::atomic<bool> cancelled_{ false };

private:
    mutable std::mutex m_;
    int fail_after_;
    std::vector<std::vector<unsigned char>> writes_;
};

// Frame source over a fixed list; ends with End or, if requested, Error.
class VectorFrameSource : public FrameSource
{
public:
    explicit VectorFrameSource(std::vector<IncomingFrame> frames, bool error_at_end = false)
        : frames_(std::move(frames)), error_at_end_(error_at_end)
    {
    }

    Next next(IncomingFrame& out) override
    {
        if (i_ >= frames_.size())
            return error_at_end_ ? Next::Error : Next::End;
        out = frames_[i_++];
        return Next::Frame;
    }

    std::size_t consumed() const
    {
        return i_;
    }

private:
    std::vector<IncomingFrame> frames_;
    bool error_at_end_;
    std::size_t i_ = 0;
};

inline IncomingFrame incoming(const std::string& ts, const std::string& payload)
{
    IncomingFrame f;
    f.has_timestamp = true;
    f.timestamp = ts;
    f.data = bytes(payload);
    return f;
}

inline IncomingFrame incoming_without_timestamp(const std::string& payload)
{
    IncomingFrame f;
    f.data = bytes(payload);
    return f;
}

// Stand-in for ffmpeg: records the descriptors and blocked signals it was
// started with into fds.txt and sigblk.txt next to the playlist (its last
// argument), then drains stdin.
inline std::string write_inspector_script(const std::string& dir)
{
    const std::string path = dir + "/inspect-ffmpeg.sh";
    {
        std::ofstream f(path);
        f << "#!/bin/sh\n"
             "for a in \"$@\"; do last=\"$a\"; done\n"
             "out=$(dirname \"$last\")\n"
             "ls -l /proc/$$/fd > \"$out/fds.txt\"\n"
             "grep SigBlk /proc/$$/status > \"$out/sigblk.txt\"\n"
             "cat > /dev/null\n";
    }
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    return path;
}

inline std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace testing_support
