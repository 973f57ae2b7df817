#include "tar_format.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>

namespace {
// ustar header layout
constexpr std::size_t OFF_NAME = 0, LEN_NAME = 100;
constexpr std::size_t OFF_MODE = 100, LEN_MODE = 8;
constexpr std::size_t OFF_UID = 108, OFF_GID = 116, LEN_ID = 8;
constexpr std::size_t OFF_SIZE = 124, LEN_SIZE = 12;
constexpr std::size_t OFF_MTIME = 136, LEN_MTIME = 12;
constexpr std::size_t OFF_CHKSUM = 148, LEN_CHKSUM = 8;
constexpr std::size_t OFF_TYPE = 156;
constexpr std::size_t OFF_MAGIC = 257;
constexpr std::size_t OFF_VERSION = 263;
constexpr std::size_t OFF_PREFIX = 345, LEN_PREFIX = 155;

const unsigned char zero_block[TAR_BLOCK] = {};

bool put_octal(unsigned char* field, std::size_t len, uint64_t v) {
    const std::size_t digits = len - 1;
    if (digits < 22 && v >> (3 * digits)) return false; // doesn't fit
    char tmp[32];
    snprintf(tmp, sizeof(tmp), "%0*llo", (int)digits, (unsigned long long)v);
    std::memcpy(field, tmp, digits);
    field[digits] = '\0';
    return true;
}

bool get_octal(const unsigned char* field, std::size_t len, uint64_t& v) {
    std::size_t i = 0;
    while (i < len && (field[i] == ' ' || field[i] == '\0')) i++;
    if (i == len) { v = 0; return true; }
    uint64_t out = 0;
    for (; i < len && field[i] != ' ' && field[i] != '\0'; i++) {
        if (field[i] < '0' || field[i] > '7') return false;
        out = (out << 3) | (uint64_t)(field[i] - '0');
    }
    v = out;
    return true;
}

unsigned checksum(const unsigned char* block) {
    unsigned sum = 0;
    for (std::size_t i = 0; i < TAR_BLOCK; i++) {
        bool in_chksum = i >= OFF_CHKSUM && i < OFF_CHKSUM + LEN_CHKSUM;
        sum += in_chksum ? ' ' : block[i];
    }
    return sum;
}

std::string field_string(const unsigned char* field, std::size_t len) {
    std::size_t n = 0;
    while (n < len && field[n] != '\0') n++;
    return std::string(reinterpret_cast<const char*>(field), n);
}

uint64_t padding_for(uint64_t size) {
    return (TAR_BLOCK - size % TAR_BLOCK) % TAR_BLOCK;
}
}

void tar_build_header(const TarEntry& entry, unsigned char block[TAR_BLOCK]) {
    std::memset(block, 0, TAR_BLOCK);
    std::memcpy(block + OFF_NAME, entry.name.data(), std::min(entry.name.size(), LEN_NAME - 1));
    put_octal(block + OFF_MODE, LEN_MODE, 0644);
    put_octal(block + OFF_UID, LEN_ID, 0);
    put_octal(block + OFF_GID, LEN_ID, 0);
    put_octal(block + OFF_SIZE, LEN_SIZE, entry.size);
    put_octal(block + OFF_MTIME, LEN_MTIME, entry.mtime < 0 ? 0 : (uint64_t)entry.mtime);
    block[OFF_TYPE] = (unsigned char)entry.type;
    std::memcpy(block + OFF_MAGIC, "ustar", 6);   // includes NUL
    std::memcpy(block + OFF_VERSION, "00", 2);

    unsigned sum = checksum(block);
    char tmp[16];
    snprintf(tmp, sizeof(tmp), "%06o", sum);
    std::memcpy(block + OFF_CHKSUM, tmp, 6);
    block[OFF_CHKSUM + 6] = '\0';
    block[OFF_CHKSUM + 7] = ' ';
}

bool tar_parse_header(const unsigned char block[TAR_BLOCK], TarEntry& entry, std::string& err) {
    uint64_t stored = 0;
    if (!get_octal(block + OFF_CHKSUM, LEN_CHKSUM, stored) || stored != checksum(block)) {
        err = "bad header checksum";
        return false;
    }
    uint64_t size = 0, mtime = 0;
    if (!get_octal(block + OFF_SIZE, LEN_SIZE, size)) { err = "bad size field"; return false; }
    if (!get_octal(block + OFF_MTIME, LEN_MTIME, mtime)) { err = "bad mtime field"; return false; }

    entry.name = field_string(block + OFF_NAME, LEN_NAME);
    if (std::memcmp(block + OFF_MAGIC, "ustar", 5) == 0) {
        std::string prefix = field_string(block + OFF_PREFIX, LEN_PREFIX);
        if (!prefix.empty()) entry.name = prefix + "/" + entry.name;
    }
    entry.size = size;
    entry.mtime = (int64_t)mtime;
    entry.type = (char)block[OFF_TYPE];
    return true;
}

// ---- TarWriter ----

TarWriter::TarWriter(std::ostream& out) : out_(out) {}

bool TarWriter::rewind_to(std::streampos pos) {
    out_.clear();
    if (pos == std::streampos(-1)) return false;
    out_.seekp(pos);
    return bool(out_);
}

TarWriter::Status TarWriter::add_file(const std::string& name, const unsigned char* data,
                                      std::size_t size, int64_t mtime) {
    const std::streampos start = out_.tellp();
    if (name.empty() || name.size() >= LEN_NAME || finished_) return Status::HeaderFailed;

    TarEntry e;
    e.name = name;
    e.size = size;
    e.mtime = mtime;
    unsigned char block[TAR_BLOCK];
    tar_build_header(e, block);

    out_.write(reinterpret_cast<const char*>(block), TAR_BLOCK);
    if (!out_) { rewind_to(start); return Status::HeaderFailed; }

    if (size) out_.write(reinterpret_cast<const char*>(data), (std::streamsize)size);
    uint64_t pad = padding_for(size);
    if (out_ && pad) out_.write(reinterpret_cast<const char*>(zero_block), (std::streamsize)pad);
    if (!out_) { rewind_to(start); return Status::DataFailed; }

    entries_++;
    return Status::Ok;
}

bool TarWriter::finish() {
    if (finished_) return true;
    finished_ = true;
    out_.write(reinterpret_cast<const char*>(zero_block), TAR_BLOCK);
    out_.write(reinterpret_cast<const char*>(zero_block), TAR_BLOCK);
    out_.flush();
    return bool(out_);
}

// ---- TarReader ----

TarReader::TarReader(std::istream& in) : in_(in) {}

bool TarReader::skip_bytes(uint64_t n) {
    char buf[4096];
    while (n > 0) {
        std::streamsize chunk = (std::streamsize)std::min<uint64_t>(n, sizeof(buf));
        in_.read(buf, chunk);
        if (in_.gcount() != chunk) return false;
        n -= (uint64_t)chunk;
    }
    return true;
}

TarReader::Next TarReader::next(TarEntry& entry) {
    if (remaining_ + padding_ > 0) {
        uint64_t n = remaining_ + padding_;
        remaining_ = padding_ = 0;
        if (!skip_bytes(n)) {
            if (in_.bad()) { error_ = "read error while skipping entry"; return Next::Error; }
            return Next::End;
        }
    }

    unsigned char block[TAR_BLOCK];
    in_.read(reinterpret_cast<char*>(block), TAR_BLOCK);
    std::streamsize got = in_.gcount();
    if (in_.bad()) { error_ = "read error"; return Next::Error; }
    if (got == 0) return Next::End;
    if (got != (std::streamsize)TAR_BLOCK) { error_ = "unexpected EOF in header"; return Next::Error; }
    if (std::memcmp(block, zero_block, TAR_BLOCK) == 0) return Next::End;

    if (!tar_parse_header(block, entry, error_)) return Next::Error;
    remaining_ = entry.size;
    padding_ = padding_for(entry.size);
    return Next::Entry;
}

bool TarReader::read_data(std::vector<unsigned char>& out) {
    out.resize(remaining_);
    if (remaining_) in_.read(reinterpret_cast<char*>(out.data()), (std::streamsize)remaining_);
    bool ok = (uint64_t)in_.gcount() == remaining_ || remaining_ == 0;
    remaining_ = 0;
    if (!ok) { padding_ = 0; out.clear(); return false; }
    return true;
}

bool TarReader::skip_data() {
    uint64_t n = remaining_;
    remaining_ = 0;
    if (!skip_bytes(n)) { padding_ = 0; return false; }
    return true;
}
