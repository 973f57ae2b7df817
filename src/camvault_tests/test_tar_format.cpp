// Unit tests for the ustar reader/writer

#include "tar_format.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <sstream>

using namespace testing_support;

namespace
{

// Stream that accepts only `limit` bytes, then fails every write.
class LimitedBuf : public std::stringbuf
{
public:
    explicit LimitedBuf(std::size_t limit) : limit_(limit)
    {
    }

protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override
    {
        auto pos = (std::size_t)(std::streamoff)pubseekoff(0, std::ios::cur, std::ios::out);
        if (pos + (std::size_t)n > limit_)
            return 0;
        return std::stringbuf::xsputn(s, n);
    }

private:
    std::size_t limit_;
};

} // namespace

TEST_CASE("Tar header carries name, size and checksum", "[tar]")
{
    TarEntry e;
    e.name = "1700000000000.jpg";
    e.size = 1234;
    e.mtime = 1700000000;
    unsigned char block[TAR_BLOCK];
    tar_build_header(e, block);

    CHECK(std::memcmp(block + 257, "ustar", 5) == 0);

    TarEntry parsed;
    std::string err;
    REQUIRE(tar_parse_header(block, parsed, err));
    CHECK(parsed.name == e.name);
    CHECK(parsed.size == 1234);
    CHECK(parsed.mtime == 1700000000);
    CHECK(parsed.regular());

    block[0] ^= 0x01;
    CHECK_FALSE(tar_parse_header(block, parsed, err));
    CHECK(err == "bad header checksum");
}

TEST_CASE("TarWriter output is block aligned and readable", "[tar]")
{
    std::stringstream ss;
    TarWriter w(ss);
    auto a = bytes("first");
    auto b = bytes(std::string(600, 'z'));
    REQUIRE(w.add_file("5.jpg", a.data(), a.size(), 0) == TarWriter::Status::Ok);
    REQUIRE(w.add_file("15.jpg", b.data(), b.size(), 0) == TarWriter::Status::Ok);
    REQUIRE(w.finish());
    CHECK(w.finish()); // second call is a no-op
    CHECK(w.entries() == 2);

    const std::string raw = ss.str();
    // 2 headers + 1 + 2 data blocks + 2 end blocks
    CHECK(raw.size() == 7 * TAR_BLOCK);

    TarReader r(ss);
    TarEntry e;
    std::vector<unsigned char> data;

    REQUIRE(r.next(e) == TarReader::Next::Entry);
    CHECK(e.name == "5.jpg");
    REQUIRE(r.read_data(data));
    CHECK(data == a);

    REQUIRE(r.next(e) == TarReader::Next::Entry);
    CHECK(e.name == "15.jpg");
    CHECK(e.size == 600);

    CHECK(r.next(e) == TarReader::Next::End);
}

TEST_CASE("TarReader skips unread payloads", "[tar]")
{
    std::stringstream ss;
    TarWriter w(ss);
    auto big = bytes(std::string(1500, 'q'));
    auto small = bytes("tail");
    w.add_file("1.jpg", big.data(), big.size(), 0);
    w.add_file("2.jpg", small.data(), small.size(), 0);
    w.finish();

    TarReader r(ss);
    TarEntry e;
    REQUIRE(r.next(e) == TarReader::Next::Entry);
    REQUIRE(r.next(e) == TarReader::Next::Entry);
    CHECK(e.name == "2.jpg");
    std::vector<unsigned char> data;
    REQUIRE(r.read_data(data));
    CHECK(data == small);
}

TEST_CASE("TarReader treats an unterminated archive as ended", "[tar]")
{
    std::stringstream ss;
    TarWriter w(ss);
    auto a = bytes("live");
    w.add_file("9.jpg", a.data(), a.size(), 0);
    // no finish(): the segment is still being written

    TarReader r(ss);
    TarEntry e;
    REQUIRE(r.next(e) == TarReader::Next::Entry);
    CHECK(r.next(e) == TarReader::Next::End);
}

TEST_CASE("TarReader reports a truncated header", "[tar]")
{
    std::stringstream ss(std::string(100, 'x'));
    TarReader r(ss);
    TarEntry e;
    CHECK(r.next(e) == TarReader::Next::Error);
    CHECK_FALSE(r.error().empty());
}

TEST_CASE("TarWriter rejects names that do not fit", "[tar]")
{
    std::stringstream ss;
    TarWriter w(ss);
    auto a = bytes("x");
    CHECK(w.add_file(std::string(100, 'n'), a.data(), a.size(), 0) == TarWriter::Status::HeaderFailed);
    CHECK(w.add_file("", a.data(), a.size(), 0) == TarWriter::Status::HeaderFailed);
    CHECK(w.entries() == 0);
}

TEST_CASE("TarWriter rewinds a failed entry", "[tar]")
{
    LimitedBuf buf(3 * TAR_BLOCK);
    std::ostream out(&buf);
    TarWriter w(out);

    auto a = bytes("ok");
    REQUIRE(w.add_file("1.jpg", a.data(), a.size(), 0) == TarWriter::Status::Ok);
    auto big = bytes(std::string(2000, 'b'));
    CHECK(w.add_file("2.jpg", big.data(), big.size(), 0) == TarWriter::Status::DataFailed);
    CHECK(out.good());
    CHECK((std::streamoff)out.tellp() == (std::streamoff)(2 * TAR_BLOCK));
    CHECK(w.entries() == 1);
}
