#pragma once
#include <cstdint>
#include <string>
#include <ctime>
#include <csignal>
#include <initializer_list>

std::string now_timestamp();            // e.g. "2025-08-16 14:32:10"
int64_t now_millis();                   // wall clock, ms since epoch

// Diagnostics to stderr, prefixed with now_timestamp().
void log_msg(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
// Only printed when set_verbose(true) was called.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void set_verbose(bool on);
bool verbose_enabled();

// Strict decimal millisecond parser: digits only, no sign, no spaces.
bool parse_millis(const std::string& s, int64_t& out);

// Remove a directory tree (if any) and create it again, empty.
bool reset_dir(const std::string& path);
bool ensure_dir(const std::string& path);

// Stream names become directory and file names.
bool valid_stream_name(const std::string& name);

// Blocks `signals` in the calling thread and in threads it starts afterwards,
// so they stay pending until wait_for_signal() collects them.
bool block_signals(std::initializer_list<int> signals, sigset_t& set);
// Returns the first signal of `set` that is (or becomes) pending, or -1 on error.
int wait_for_signal(const sigset_t& set);
