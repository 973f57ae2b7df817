#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <limits>
#include <pthread.h>
#include <system_error>

static std::atomic<bool> g_verbose{false};

std::string now_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm); // thread-safe
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return std::string();
    return std::string(buf);
}

int64_t now_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static void vlog(const char* fmt, va_list ap) {
    char line[1024];
    vsnprintf(line, sizeof(line), fmt, ap);
    // single fprintf so lines from different threads don't interleave
    fprintf(stderr, "%s %s\n", now_timestamp().c_str(), line);
}

void log_msg(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vlog(fmt, ap);
    va_end(ap);
}

void log_debug(const char* fmt, ...) {
    if (!g_verbose) return;
    va_list ap;
    va_start(ap, fmt);
    vlog(fmt, ap);
    va_end(ap);
}

void set_verbose(bool on) { g_verbose = on; }
bool verbose_enabled() { return g_verbose; }

bool parse_millis(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 19) return false;
    int64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        int d = c - '0';
        if (v > (std::numeric_limits<int64_t>::max() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool reset_dir(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        log_msg("could not clean up %s: %s", path.c_str(), ec.message().c_str());
        return false;
    }
    return ensure_dir(path);
}

bool ensure_dir(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        log_msg("could not create %s: %s", path.c_str(), ec.message().c_str());
        return false;
    }
    return fs::is_directory(path, ec);
}

bool valid_stream_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string::npos) return false;
    if (name.find("..") != std::string::npos) return false;
    return true;
}

bool block_signals(std::initializer_list<int> signals, sigset_t& set) {
    sigemptyset(&set);
    for (int sig : signals) sigaddset(&set, sig);
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        log_msg("pthread_sigmask: %s", strerror(rc));
        return false;
    }
    return true;
}

int wait_for_signal(const sigset_t& set) {
    int sig = 0;
    int rc = sigwait(&set, &sig);
    if (rc != 0) {
        log_msg("sigwait: %s", strerror(rc));
        return -1;
    }
    return sig;
}
