// Unit tests for segment naming and selection

#include "segment_store.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace testing_support;

TEST_CASE("Segment names are zero padded and sort by start time", "[segments]")
{
    CHECK(segment_file_name("cam1", 0) == "cam1_0000000000000.tar");
    CHECK(segment_file_name("cam1", 1700000000000) == "cam1_1700000000000.tar");
    CHECK(segment_file_name("cam1", 60000) < segment_file_name("cam1", 120000));
}

TEST_CASE("Segment names parse back to their start", "[segments]")
{
    int64_t start = -1;
    CHECK(parse_segment_file_name("cam1_0000000060000.tar", start));
    CHECK(start == 60000);

    SECTION("stream names may contain underscores")
    {
        CHECK(parse_segment_file_name("front_door_0000000000042.tar", start));
        CHECK(start == 42);
    }

    SECTION("unrelated files are ignored")
    {
        CHECK_FALSE(parse_segment_file_name("cam1_123.txt", start));
        CHECK_FALSE(parse_segment_file_name("notes.tar", start));
        CHECK_FALSE(parse_segment_file_name("cam1_-5.tar", start));
        CHECK_FALSE(parse_segment_file_name(".tar", start));
    }
}

TEST_CASE("select_segment picks the greatest start not after the target", "[segments]")
{
    std::vector<SegmentInfo> segs = { { 60000, "b" }, { 0, "a" }, { 120000, "c" } };
    SegmentInfo out;

    REQUIRE(select_segment(segs, 60200, out));
    CHECK(out.path == "b");
    REQUIRE(select_segment(segs, 59999, out));
    CHECK(out.path == "a");
    REQUIRE(select_segment(segs, 120000, out));
    CHECK(out.path == "c");
    REQUIRE(select_segment(segs, 999999, out));
    CHECK(out.path == "c");

    std::vector<SegmentInfo> later = { { 1000, "x" } };
    CHECK_FALSE(select_segment(later, 999, out));
    CHECK_FALSE(select_segment({}, 5, out));
}

TEST_CASE("list_segments reads the stream directory", "[segments]")
{
    TempDir dir;
    std::vector<SegmentInfo> segs;

    SECTION("missing directory")
    {
        CHECK(list_segments(dir.path() + "/nope", segs) == ListStatus::NoStream);
        CHECK(segs.empty());
    }

    SECTION("only segment files are listed")
    {
        std::ofstream(dir.path() + "/" + segment_file_name("cam", 0)).put('x');
        std::ofstream(dir.path() + "/" + segment_file_name("cam", 60000)).put('x');
        std::ofstream(dir.path() + "/readme.txt").put('x');
        fs::create_directories(dir.path() + "/cam_0000000000099.tar");

        REQUIRE(list_segments(dir.path(), segs) == ListStatus::Ok);
        REQUIRE(segs.size() == 2);
        SegmentInfo best;
        REQUIRE(select_segment(segs, 70000, best));
        CHECK(best.start_ms == 60000);
        CHECK(best.path == dir.path() + "/" + segment_file_name("cam", 60000));
    }
}
