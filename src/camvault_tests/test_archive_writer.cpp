// Unit tests for ArchiveWriter

#include "archive_writer.hpp"
#include "dispatch_pipeline.hpp"
#include "frame_retriever.hpp"
#include "segment_store.hpp"
#include "tar_format.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <fstream>
#include <streambuf>
#include <thread>

using namespace testing_support;

namespace
{

// Queues all frames, closes the hand-off and runs the writer to completion.
ArchiveWriter::Stats archive(const std::string& dir, const std::vector<int64_t>& timestamps,
                             int64_t window_ms = 60000)
{
    FrameHandoff h(timestamps.size() + 1);
    for (int64_t ts : timestamps)
        h.try_push(make_frame(ts, payload_for(ts)));
    h.close();
    ArchiveWriter w(dir, "cam", window_ms);
    w.run(h);
    CHECK(w.state() == ArchiveWriter::State::Closed);
    return w.stats();
}

std::vector<std::string> entry_names(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    TarReader r(in);
    TarEntry e;
    std::vector<std::string> names;
    while (r.next(e) == TarReader::Next::Entry)
        names.push_back(e.name);
    return names;
}

// File buffer that refuses any write containing `poison`, like a disk error
// hitting one frame's payload. Seeks and flushes go to the real file.
class PoisonFileBuf : public std::streambuf
{
public:
    PoisonFileBuf(const std::string& path, std::string poison) : poison_(std::move(poison))
    {
        file_.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    }

    bool is_open() const
    {
        return file_.is_open();
    }

protected:
    int_type overflow(int_type c) override
    {
        if (traits_type::eq_int_type(c, traits_type::eof()))
            return traits_type::not_eof(c);
        return file_.sputc(traits_type::to_char_type(c));
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override
    {
        if (std::string(s, (std::size_t)n).find(poison_) != std::string::npos)
            return 0;
        return file_.sputn(s, n);
    }

    pos_type seekoff(off_type off, std::ios::seekdir dir, std::ios::openmode which) override
    {
        return file_.pubseekoff(off, dir, which);
    }

    pos_type seekpos(pos_type pos, std::ios::openmode which) override
    {
        return file_.pubseekpos(pos, which);
    }

    int sync() override
    {
        return file_.pubsync();
    }

private:
    std::filebuf file_;
    std::string poison_;
};

class PoisonStream : public std::ostream
{
public:
    PoisonStream(const std::string& path, const std::string& poison) : std::ostream(nullptr), buf_(path, poison)
    {
        rdbuf(&buf_);
    }

    bool is_open() const
    {
        return buf_.is_open();
    }

private:
    PoisonFileBuf buf_;
};

// Writer whose segment files fail every payload write containing `poison`.
class PoisonedArchiveWriter : public ArchiveWriter
{
public:
    PoisonedArchiveWriter(const std::string& dir, std::string poison)
        : ArchiveWriter(dir, "cam"), poison_(std::move(poison))
    {
    }

protected:
    std::unique_ptr<std::ostream> open_segment_stream(const std::string& path) override
    {
        auto s = std::make_unique<PoisonStream>(path, poison_);
        if (!s->is_open())
            return nullptr;
        return s;
    }

private:
    std::string poison_;
};

} // namespace

TEST_CASE("ArchiveWriter groups frames into one segment per window", "[archive]")
{
    TempDir dir;
    auto stats = archive(dir.path(), { 0, 30000, 59999, 60000, 61000, 125000 });

    CHECK(stats.segments_created == 3);
    CHECK(stats.segments_finalized == 3);
    CHECK(stats.frames_written == 6);
    CHECK_FALSE(stats.halted);

    const std::string s0 = dir.path() + "/" + segment_file_name("cam", 0);
    const std::string s1 = dir.path() + "/" + segment_file_name("cam", 60000);
    const std::string s2 = dir.path() + "/" + segment_file_name("cam", 125000);
    CHECK(entry_names(s0) == std::vector<std::string>{ "0.jpg", "30000.jpg", "59999.jpg" });
    CHECK(entry_names(s1) == std::vector<std::string>{ "60000.jpg", "61000.jpg" });
    CHECK(entry_names(s2) == std::vector<std::string>{ "125000.jpg" });
}

TEST_CASE("ArchiveWriter anchors windows at the first frame of each segment", "[archive]")
{
    TempDir dir;
    auto stats = archive(dir.path(), { 1000, 60999, 61000 }, 60000);
    CHECK(stats.segments_created == 2);
    CHECK(fs::exists(dir.path() + "/" + segment_file_name("cam", 1000)));
    CHECK(fs::exists(dir.path() + "/" + segment_file_name("cam", 61000)));
}

TEST_CASE("ArchiveWriter with no frames creates nothing", "[archive]")
{
    TempDir dir;
    auto stats = archive(dir.path(), {});
    CHECK(stats.segments_created == 0);
    CHECK(stats.segments_finalized == 0);
    CHECK(fs::is_empty(dir.path()));
}

TEST_CASE("ArchiveWriter finalizes the open segment exactly once", "[archive]")
{
    TempDir dir;
    FrameHandoff h(8);
    ArchiveWriter w(dir.path(), "cam");
    std::thread t([&] { w.run(h); });
    h.try_push(make_frame(5, "a"));
    h.try_push(make_frame(15, "b"));
    h.close();
    h.cancel();
    h.close();
    t.join();

    auto stats = w.stats();
    CHECK(stats.segments_created == 1);
    CHECK(stats.segments_finalized == 1);

    // end-of-archive marker present
    auto size = fs::file_size(dir.path() + "/" + segment_file_name("cam", 5));
    CHECK(size == 6 * TAR_BLOCK);
}

TEST_CASE("ArchiveWriter halts when a segment cannot be created", "[archive]")
{
    TempDir dir;
    FrameHandoff h(4);
    h.try_push(make_frame(5, "a"));
    h.try_push(make_frame(15, "b"));
    h.close();

    ArchiveWriter w(dir.path() + "/missing/dir", "cam");
    w.run(h);
    auto stats = w.stats();
    CHECK(stats.halted);
    CHECK(stats.segments_created == 0);
    CHECK(stats.frames_written == 0);
    CHECK(w.state() == ArchiveWriter::State::Closed);
}

TEST_CASE("ArchiveWriter skips a frame whose write fails and keeps the segment", "[archive]")
{
    TempDir dir;
    FrameHandoff h(8);
    h.try_push(make_frame(5, "five"));
    h.try_push(make_frame(15, "BROKEN-fifteen"));
    h.try_push(make_frame(25, "twenty-five"));
    h.close();

    PoisonedArchiveWriter w(dir.path(), "BROKEN");
    w.run(h);

    auto stats = w.stats();
    CHECK(stats.frames_written == 2);
    CHECK(stats.frames_skipped == 1);
    CHECK(stats.segments_created == 1);
    CHECK_FALSE(stats.halted);

    const std::string seg = dir.path() + "/" + segment_file_name("cam", 5);
    CHECK(entry_names(seg) == std::vector<std::string>{ "5.jpg", "25.jpg" });

    // the gap answers with the previous frame
    auto res = FrameRetriever::scan_segment(seg, 20);
    REQUIRE(res.status == FrameRetriever::Status::Found);
    CHECK(res.timestamp_ms == 5);
}

TEST_CASE("Frames dropped by a full hand-off never reach the archive", "[archive]")
{
    TempDir dir;
    FrameHandoff h(2);
    FakeTranscoder live;
    CancelToken cancel;
    DispatchPipeline p(h, live, cancel);

    VectorFrameSource src({ incoming("100", "a"), incoming("200", "b"), incoming("300", "c") });
    p.run(src);
    CHECK(p.stats().archive_dropped == 1);
    CHECK(live.writes().size() == 3);

    ArchiveWriter w(dir.path(), "cam");
    w.run(h);

    const std::string seg = dir.path() + "/" + segment_file_name("cam", 100);
    CHECK(entry_names(seg) == std::vector<std::string>{ "100.jpg", "200.jpg" });

    auto res = FrameRetriever::scan_segment(seg, 300);
    REQUIRE(res.status == FrameRetriever::Status::Found);
    CHECK(res.timestamp_ms == 200);
}

TEST_CASE("Frames in the open segment are readable before it is finalized", "[archive]")
{
    TempDir dir;
    FrameHandoff h(8);
    ArchiveWriter w(dir.path(), "cam");
    std::thread t([&] { w.run(h); });

    h.try_push(make_frame(5, "a"));
    h.try_push(make_frame(15, "b"));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (w.stats().frames_written < 2 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    REQUIRE(w.stats().frames_written == 2);
    CHECK(w.state() == ArchiveWriter::State::SegmentOpen);

    auto res = FrameRetriever::scan_segment(dir.path() + "/" + segment_file_name("cam", 5), 20);
    CHECK(res.status == FrameRetriever::Status::Found);
    CHECK(res.timestamp_ms == 15);

    h.close();
    t.join();
}
