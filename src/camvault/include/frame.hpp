#pragma once
#include <cstdint>
#include <string>
#include <vector>

// One JPEG image and the capture time the producer attached to it.
struct Frame {
    int64_t timestamp_ms = 0;
    std::vector<unsigned char> data;
};

// Entry name inside a segment: "<timestamp>.jpg".
std::string frame_entry_name(int64_t timestamp_ms);
// Inverse of frame_entry_name(); false if the name carries no valid timestamp.
bool parse_frame_entry_name(const std::string& name, int64_t& timestamp_ms);
