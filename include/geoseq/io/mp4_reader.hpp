#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace geoseq::io {

namespace fs = std::filesystem;

// Seconds between 1904-01-01 (QuickTime epoch) and 1970-01-01
constexpr uint64_t MP4_EPOCH_OFFSET = 2082844800ULL;

// One ISO BMFF box inside an in-memory buffer
struct Box {
    std::string type;
    size_t offset = 0;       // of the header, relative to the parsed buffer
    size_t header_size = 8;
    size_t size = 0;         // header included
    const uint8_t* data = nullptr;
    size_t data_size = 0;
};

// Sibling boxes in [data, data + size). Throws ParseError on malformed headers.
std::vector<Box> parse_boxes(const uint8_t* data, size_t size);

// First box matching a path such as {"moov", "udta", "\xa9mak"}
std::optional<Box> find_box(const uint8_t* data, size_t size, const std::vector<std::string>& path);

struct Mp4Sample {
    uint64_t offset = 0;
    uint32_t size = 0;
    std::string format;      // sample description format, e.g. "gpmd", "camm"
    double exact_time = 0.0; // seconds from track start
    double duration = 0.0;   // seconds
};

struct Mp4Track {
    uint32_t timescale = 0;
    std::string handler_type;
    std::vector<std::string> formats;
    std::vector<Mp4Sample> samples;

    bool has_format(const std::string& fmt) const;
};

struct Mp4Movie {
    std::optional<double> creation_time; // unix seconds
    uint32_t timescale = 0;
    double duration = 0.0;
    std::vector<Mp4Track> tracks;
};

// Parses the payload of a moov box
Mp4Movie parse_moov(const uint8_t* data, size_t size);

/**
 * Random access reader for MP4/MOV containers.
 * Only the top level box headers are scanned eagerly; payloads are read on demand
 * so large mdat boxes are never loaded.
 */
class Mp4Reader {
public:
    explicit Mp4Reader(const fs::path& path);
    explicit Mp4Reader(std::vector<uint8_t> bytes);

    struct TopLevelBox {
        std::string type;
        uint64_t offset = 0;
        uint64_t header_size = 8;
        uint64_t size = 0;
    };

    const std::vector<TopLevelBox>& top_level() const { return boxes_; }

    // Payload of the first top level box of this type
    std::optional<std::vector<uint8_t>> read_top_level(const std::string& type);

    std::vector<uint8_t> read_range(uint64_t offset, uint64_t size);

    // Parsed moov box. Throws ParseError if there is none.
    const Mp4Movie& movie();

    // Raw moov payload, for lookups the movie model does not cover
    const std::vector<uint8_t>& moov_bytes();

private:
    fs::path path_;
    std::ifstream file_;
    std::vector<uint8_t> buffer_;
    bool in_memory_ = false;
    uint64_t length_ = 0;
    std::vector<TopLevelBox> boxes_;
    std::optional<std::vector<uint8_t>> moov_;
    std::optional<Mp4Movie> movie_;

    void scan();
};

} // namespace geoseq::io
