#include "segment_store.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <cstdio>
#include <filesystem>
#include <system_error>

std::string segment_file_name(const std::string& stream, int64_t start_ms) {
    char digits[32];
    snprintf(digits, sizeof(digits), "%0*lld", cfg::SEGMENT_START_DIGITS, (long long)start_ms);
    return stream + "_" + digits + cfg::SEGMENT_SUFFIX;
}

bool parse_segment_file_name(const std::string& file_name, int64_t& start_ms) {
    const std::string& sfx = cfg::SEGMENT_SUFFIX;
    if (file_name.size() <= sfx.size() ||
        file_name.compare(file_name.size() - sfx.size(), sfx.size(), sfx) != 0)
        return false;
    std::string base = file_name.substr(0, file_name.size() - sfx.size());
    auto us = base.rfind('_');
    if (us == std::string::npos) return false;
    return parse_millis(base.substr(us + 1), start_ms);
}

ListStatus list_segments(const std::string& dir, std::vector<SegmentInfo>& out) {
    namespace fs = std::filesystem;
    out.clear();
    std::error_code ec;
    if (!fs::exists(dir, ec)) return ec ? ListStatus::Error : ListStatus::NoStream;

    fs::directory_iterator it(dir, ec);
    if (ec) {
        log_msg("Failed to read directory %s: %s", dir.c_str(), ec.message().c_str());
        return ListStatus::Error;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        SegmentInfo s;
        if (!parse_segment_file_name(it->path().filename().string(), s.start_ms)) continue;
        s.path = it->path().string();
        out.push_back(std::move(s));
    }
    if (ec) {
        log_msg("Failed to read directory %s: %s", dir.c_str(), ec.message().c_str());
        return ListStatus::Error;
    }
    return ListStatus::Ok;
}

bool select_segment(const std::vector<SegmentInfo>& segments, int64_t target_ms, SegmentInfo& out) {
    const SegmentInfo* best = nullptr;
    for (auto& s : segments) {
        if (s.start_ms <= target_ms && (!best || s.start_ms > best->start_ms)) best = &s;
    }
    if (!best) return false;
    out = *best;
    return true;
}
