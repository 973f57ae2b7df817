#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

// Minimal POSIX ustar support: regular-file entries only, names < 100 bytes.
// Archive segments are plain tar files so standard tools can open them.

inline constexpr std::size_t TAR_BLOCK = 512;

struct TarEntry {
    std::string name;
    uint64_t size = 0;
    char type = '0';
    int64_t mtime = 0;

    bool regular() const { return type == '0' || type == '\0'; }
};

class TarWriter {
public:
    enum class Status { Ok, HeaderFailed, DataFailed };

    explicit TarWriter(std::ostream& out);

    // On failure the stream is rewound to where the entry started, so the
    // next entry overwrites the partial one.
    Status add_file(const std::string& name, const unsigned char* data, std::size_t size, int64_t mtime);
    // Writes the end-of-archive marker and flushes. Safe to call more than once.
    bool finish();

    std::size_t entries() const { return entries_; }

private:
    std::ostream& out_;
    std::size_t entries_ = 0;
    bool finished_ = false;

    bool rewind_to(std::streampos pos);
};

class TarReader {
public:
    enum class Next { Entry, End, Error };

    explicit TarReader(std::istream& in);

    // Advances to the next header, skipping any unread payload of the current entry.
    // A clean EOF on a block boundary counts as End (the archive may still be open for writing).
    Next next(TarEntry& entry);
    // Payload of the current entry. False on a short read.
    bool read_data(std::vector<unsigned char>& out);
    bool skip_data();

    const std::string& error() const { return error_; }

private:
    std::istream& in_;
    uint64_t remaining_ = 0;
    uint64_t padding_ = 0;
    std::string error_;

    bool skip_bytes(uint64_t n);
};

// Header helpers, exposed for tests.
void tar_build_header(const TarEntry& entry, unsigned char block[TAR_BLOCK]);
bool tar_parse_header(const unsigned char block[TAR_BLOCK], TarEntry& entry, std::string& err);
