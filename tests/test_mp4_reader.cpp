#include "geoseq/core/errors.hpp"
#include "geoseq/io/mp4_reader.hpp"
#include "support/mp4_builder.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace geoseq;
using namespace geoseq::testing;
using Catch::Approx;

TEST_CASE("parse_boxes_handles_64bit_and_open_ended_sizes") {
    Bytes data;
    // 64-bit size box "big " with 4 payload bytes
    put_u32be(data, 1);
    put_str(data, "big ");
    put_u64be(data, 20);
    put_u32be(data, 0xdeadbeef);
    // size 0 runs to the end of the parent
    put_u32be(data, 0);
    put_str(data, "rest");
    put_u32be(data, 7);

    auto boxes = io::parse_boxes(data.data(), data.size());
    REQUIRE(boxes.size() == 2);
    REQUIRE(boxes[0].type == "big ");
    REQUIRE(boxes[0].header_size == 16);
    REQUIRE(boxes[0].data_size == 4);
    REQUIRE(boxes[1].type == "rest");
    REQUIRE(boxes[1].data_size == 4);
}

TEST_CASE("parse_boxes_rejects_bad_sizes") {
    Bytes too_small;
    put_u32be(too_small, 4);
    put_str(too_small, "oops");
    REQUIRE_THROWS_AS(io::parse_boxes(too_small.data(), too_small.size()), ParseError);

    Bytes too_big = box("free", Bytes(8, 0));
    too_big.resize(too_big.size() - 3);
    REQUIRE_THROWS_AS(io::parse_boxes(too_big.data(), too_big.size()), ParseError);
}

TEST_CASE("find_box_follows_a_path") {
    Bytes moov = box("moov", box("udta", box("name", Bytes{'x'})));
    auto found = io::find_box(moov.data(), moov.size(), {"moov", "udta", "name"});
    REQUIRE(found.has_value());
    REQUIRE(found->data_size == 1);
    REQUIRE(found->data[0] == 'x');
    REQUIRE_FALSE(io::find_box(moov.data(), moov.size(), {"moov", "meta"}).has_value());
}

TEST_CASE("mp4_reader_builds_sample_table") {
    TrackSpec spec;
    spec.format = "gpmd";
    spec.timescale = 1000;
    spec.sample_delta = 1001;
    spec.samples = {Bytes(10, 1), Bytes(20, 2), Bytes(30, 3)};

    const double created = 1600000000.0;
    io::Mp4Reader reader(build_mp4({spec}, created));

    REQUIRE(reader.top_level().size() == 3);
    const auto& movie = reader.movie();
    REQUIRE(movie.creation_time.has_value());
    REQUIRE(*movie.creation_time == Approx(created));
    REQUIRE(movie.tracks.size() == 1);

    const auto& track = movie.tracks[0];
    REQUIRE(track.handler_type == "meta");
    REQUIRE(track.has_format("gpmd"));
    REQUIRE(track.samples.size() == 3);
    REQUIRE(track.samples[1].size == 20);
    REQUIRE(track.samples[1].exact_time == Approx(1.001));
    REQUIRE(track.samples[2].duration == Approx(1.001));

    auto bytes = reader.read_range(track.samples[2].offset, track.samples[2].size);
    REQUIRE(bytes == Bytes(30, 3));
}

TEST_CASE("mp4_reader_pads_missing_stts_deltas_with_zero") {
    TrackSpec spec;
    spec.samples = {Bytes(4, 0), Bytes(4, 0)};
    Bytes file = build_mp4({spec}, 0.0);
    // stts describes one sample with a zero delta; the second is not covered
    const Bytes needle = {'s', 't', 't', 's'};
    auto it = std::search(file.begin(), file.end(), needle.begin(), needle.end());
    REQUIRE(it != file.end());
    const size_t pos = static_cast<size_t>(it - file.begin()) + 4 + 4 + 4; // type, version/flags, entry count
    file[pos + 3] = 1;
    file[pos + 7] = 0;
    file[pos + 6] = 0;

    io::Mp4Reader reader(file);
    const auto& samples = reader.movie().tracks[0].samples;
    REQUIRE(samples.size() == 2);
    REQUIRE(samples[0].duration == Approx(0.0));
    REQUIRE(samples[1].duration == Approx(0.0));
    REQUIRE_FALSE(reader.movie().creation_time.has_value());
}

TEST_CASE("mp4_reader_rejects_truncated_container") {
    TrackSpec spec;
    spec.samples = {Bytes(100, 0)};
    Bytes file = build_mp4({spec}, 1600000000.0);
    file.resize(file.size() - 50);
    REQUIRE_THROWS_AS(io::Mp4Reader(file), ParseError);
}

TEST_CASE("mp4_reader_rejects_non_mp4_data") {
    REQUIRE_THROWS_AS(io::Mp4Reader(Bytes{1, 2, 3}), ParseError);
}

TEST_CASE("mp4_reader_without_moov_throws_on_movie") {
    io::Mp4Reader reader(box("free", Bytes(8, 0)));
    REQUIRE_THROWS_AS(reader.movie(), ParseError);
}

TEST_CASE("mp4_reader_reads_from_file") {
    TrackSpec spec;
    spec.format = "camm";
    spec.samples = {Bytes(8, 9)};
    const auto dir = make_temp_dir("mp4");
    const auto path = write_file(dir / "clip.mp4", build_mp4({spec}, 1600000000.0));

    io::Mp4Reader reader(path);
    REQUIRE(reader.movie().tracks[0].has_format("camm"));
    REQUIRE_THROWS_AS(io::Mp4Reader(dir / "missing.mp4"), IOError);
    fs::remove_all(dir);
}
