#include "frame.hpp"
#include "config.hpp"
#include "utils.hpp"

std::string frame_entry_name(int64_t timestamp_ms) {
    return std::to_string(timestamp_ms) + cfg::FRAME_SUFFIX;
}

bool parse_frame_entry_name(const std::string& name, int64_t& timestamp_ms) {
    std::string base = name;
    const std::string& sfx = cfg::FRAME_SUFFIX;
    if (base.size() >= sfx.size() && base.compare(base.size() - sfx.size(), sfx.size(), sfx) == 0)
        base.resize(base.size() - sfx.size());
    return parse_millis(base, timestamp_ms);
}
