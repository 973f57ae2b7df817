#pragma once
#include <string>
#include <vector>

// One part of the upload, before its timestamp marker has been validated.
struct IncomingFrame {
    bool has_timestamp = false;
    std::string timestamp;               // marker exactly as sent
    std::vector<unsigned char> data;
};

// Pull interface over the upload: frames in arrival order, then End,
// or Error if the underlying stream broke.
class FrameSource {
public:
    enum class Next { Frame, End, Error };

    virtual ~FrameSource() = default;
    virtual Next next(IncomingFrame& out) = 0;
};
