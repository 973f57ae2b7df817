#include "transcoder.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <linux/close_range.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_bin, std::string hls_dir, bool verbose)
    : bin_(std::move(ffmpeg_bin)), hls_dir_(std::move(hls_dir)), verbose_(verbose) {}

FfmpegTranscoder::~FfmpegTranscoder() {
    if (pid_ > 0 && !reaped_) {
        cancel();
        finish();
    }
    close_stdin();
}

std::vector<std::string> FfmpegTranscoder::build_args(const std::string& hls_dir, bool verbose) {
    std::vector<std::string> args;
    if (!verbose) { args.push_back("-loglevel"); args.push_back("error"); }
    const std::vector<std::string> rest = {
        "-f", "mjpeg",
        "-framerate", std::to_string(cfg::TRANSCODE_FPS),
        "-i", "-",
        "-c:v", "libx264",
        "-preset", "veryfast",
        "-tune", "zerolatency",
        "-crf", "23",
        "-g", "10",
        "-hls_time", std::to_string(cfg::HLS_SEGMENT_SECONDS),
        "-hls_list_size", std::to_string(cfg::HLS_LIST_SIZE),
        "-hls_flags", "delete_segments",
        "-flush_packets", "1",
        "-hls_segment_filename", hls_dir + "/segment%03d.ts",
        hls_dir + "/playlist.m3u8",
    };
    args.insert(args.end(), rest.begin(), rest.end());
    return args;
}

bool FfmpegTranscoder::start() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) { perror("pipe ffmpeg stdin"); return false; }
    // closed by a successful exec; otherwise carries the child's errno
    int errfds[2];
    if (pipe2(errfds, O_CLOEXEC) < 0) {
        perror("pipe ffmpeg exec status");
        close(fds[0]); close(fds[1]);
        return false;
    }

    std::vector<std::string> args = build_args(hls_dir_, verbose_);
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(bin_.c_str()));
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        perror("fork ffmpeg");
        close(fds[0]); close(fds[1]);
        close(errfds[0]); close(errfds[1]);
        return false;
    }
    if (pid == 0) {
        // child: stdin from the pipe, stdout/stderr inherited
        dup2(fds[0], STDIN_FILENO);
        // nothing else the server holds (sockets, other segments) survives the exec
        if (close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) < 0) {
            // kernel without close_range flags: close what we can, keep the exec status pipe
            for (int fd = 3; fd < 1024; fd++)
                if (fd != errfds[1]) close(fd);
        }
        signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(errfds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(fds[0]);
    close(errfds[1]);
    int child_errno = 0;
    ssize_t n;
    do { n = read(errfds[0], &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
    close(errfds[0]);
    if (n > 0) {
        log_msg("Failed to start %s: %s", bin_.c_str(), strerror(child_errno));
        close(fds[1]);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return false;
    }

    std::lock_guard<std::mutex> lk(m_);
    pid_ = pid;
    stdin_fd_ = fds[1];
    log_debug("started %s (pid %d) for %s", bin_.c_str(), (int)pid, hls_dir_.c_str());
    return true;
}

bool FfmpegTranscoder::write(const unsigned char* data, std::size_t size) {
    int fd;
    {
        std::lock_guard<std::mutex> lk(m_);
        fd = stdin_fd_;
    }
    if (fd < 0 || cancelled_) return false;
    std::size_t off = 0;
    while (off < size) {
        ssize_t n = ::write(fd, data + off, size - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (!cancelled_) log_msg("Error writing frame to ffmpeg: %s", strerror(errno));
            return false;
        }
        off += (std::size_t)n;
    }
    return true;
}

void FfmpegTranscoder::close_stdin() {
    std::lock_guard<std::mutex> lk(m_);
    if (stdin_fd_ >= 0) { close(stdin_fd_); stdin_fd_ = -1; }
}

bool FfmpegTranscoder::finish() {
    // ffmpeg exits once its stdin is closed
    close_stdin();

    pid_t pid;
    {
        std::lock_guard<std::mutex> lk(m_);
        if (pid_ <= 0 || reaped_) return false;
        pid = pid_;
    }
    int status = 0;
    pid_t r;
    do { r = waitpid(pid, &status, 0); } while (r < 0 && errno == EINTR);
    {
        std::lock_guard<std::mutex> lk(m_);
        reaped_ = true;
    }
    if (r < 0) { perror("waitpid ffmpeg"); return false; }

    bool ok = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    if (!ok && !cancelled_) {
        if (WIFEXITED(status))
            log_msg("ffmpeg command finished with error: exit status %d", WEXITSTATUS(status));
        else if (WIFSIGNALED(status))
            log_msg("ffmpeg command finished with error: signal %d", WTERMSIG(status));
    }
    return ok;
}

void FfmpegTranscoder::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lk(m_);
    if (pid_ > 0 && !reaped_) kill(pid_, SIGKILL);
}
