#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Segment files are named "<stream>_<start>.tar", start zero-padded so a
// plain name sort is a start-time sort. The name is the whole index.

struct SegmentInfo {
    int64_t start_ms = 0;
    std::string path;
};

std::string segment_file_name(const std::string& stream, int64_t start_ms);
// Takes the text after the last '_' of a "*.tar" name.
bool parse_segment_file_name(const std::string& file_name, int64_t& start_ms);

enum class ListStatus { Ok, NoStream, Error };

// All segments found in dir, unordered.
ListStatus list_segments(const std::string& dir, std::vector<SegmentInfo>& out);

// Greatest start <= target, by a linear scan over the listing.
bool select_segment(const std::vector<SegmentInfo>& segments, int64_t target_ms, SegmentInfo& out);
