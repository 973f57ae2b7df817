#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

// Consumer of the live JPEG byte stream. Accepts an ordered byte stream and
// reports completion or failure; what it does with the bytes is its own business.
class TranscoderSink {
public:
    virtual ~TranscoderSink() = default;

    // Blocks until the bytes are accepted. False once the consumer is gone.
    virtual bool write(const unsigned char* data, std::size_t size) = 0;
    // Ends the input and waits for the consumer. True on a clean exit.
    virtual bool finish() = 0;
    // Abort; unblocks a pending write(). Safe from any thread, any number of times.
    virtual void cancel() = 0;
};

// ffmpeg reading MJPEG on stdin and writing an HLS playlist.
class FfmpegTranscoder : public TranscoderSink {
public:
    FfmpegTranscoder(std::string ffmpeg_bin, std::string hls_dir, bool verbose);
    ~FfmpegTranscoder() override;

    bool start();

    bool write(const unsigned char* data, std::size_t size) override;
    bool finish() override;
    void cancel() override;

    static std::vector<std::string> build_args(const std::string& hls_dir, bool verbose);

private:
    std::string bin_;
    std::string hls_dir_;
    bool verbose_;

    std::mutex m_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    bool reaped_ = false;
    std::atomic<bool> cancelled_{false};

    void close_stdin();
};
