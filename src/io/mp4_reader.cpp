#include "geoseq/io/mp4_reader.hpp"
#include "geoseq/io/byte_reader.hpp"
#include "geoseq/core/errors.hpp"

#include <algorithm>

namespace geoseq::io {

namespace {

constexpr uint64_t MAX_PAYLOAD_READ = 512ULL * 1024 * 1024;

struct StscEntry {
    uint32_t first_chunk = 0;
    uint32_t samples_per_chunk = 0;
    uint32_t description_index = 0;
};

struct SampleTable {
    std::vector<std::string> formats;
    std::vector<uint32_t> sizes;
    std::vector<uint64_t> chunk_offsets;
    std::vector<StscEntry> stsc;
    std::vector<uint32_t> deltas;
};

void check_count(const ByteReader& r, uint64_t count, size_t entry_size, const char* box) {
    if (count * entry_size > r.remaining()) {
        throw ParseError(std::string("Entry count of ") + box + " exceeds box size");
    }
}

std::vector<std::string> parse_stsd(const Box& box) {
    ByteReader r(box.data, box.data_size);
    r.skip(4); // version + flags
    const uint32_t count = r.u32be();
    check_count(r, count, 8, "stsd");

    std::vector<std::string> formats;
    for (uint32_t i = 0; i < count; ++i) {
        const size_t start = r.pos();
        const uint32_t size = r.u32be();
        std::string format = r.fourcc();
        if (size < 8 || size > r.size() - start) {
            throw ParseError("Invalid sample description entry size");
        }
        formats.push_back(format);
        r.seek(start + size);
    }
    return formats;
}

std::vector<uint32_t> parse_stsz(const Box& box) {
    ByteReader r(box.data, box.data_size);
    r.skip(4);
    const uint32_t sample_size = r.u32be();
    const uint32_t count = r.u32be();

    std::vector<uint32_t> sizes;
    if (sample_size != 0) {
        // Constant size: nothing else is stored, cap to something sane
        if (count > 100000000U) {
            throw ParseError("Unreasonable stsz sample count");
        }
        sizes.assign(count, sample_size);
        return sizes;
    }
    check_count(r, count, 4, "stsz");
    sizes.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        sizes.push_back(r.u32be());
    }
    return sizes;
}

std::vector<uint64_t> parse_chunk_offsets(const Box& box, bool is64) {
    ByteReader r(box.data, box.data_size);
    r.skip(4);
    const uint32_t count = r.u32be();
    check_count(r, count, is64 ? 8 : 4, is64 ? "co64" : "stco");

    std::vector<uint64_t> offsets;
    offsets.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        offsets.push_back(is64 ? r.u64be() : r.u32be());
    }
    return offsets;
}

std::vector<StscEntry> parse_stsc(const Box& box) {
    ByteReader r(box.data, box.data_size);
    r.skip(4);
    const uint32_t count = r.u32be();
    check_count(r, count, 12, "stsc");

    std::vector<StscEntry> entries;
    entries.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        StscEntry e;
        e.first_chunk = r.u32be();
        e.samples_per_chunk = r.u32be();
        e.description_index = r.u32be();
        entries.push_back(e);
    }
    return entries;
}

// Expanded per-sample deltas, at most max_samples long
std::vector<uint32_t> parse_stts(const Box& box, size_t max_samples) {
    ByteReader r(box.data, box.data_size);
    r.skip(4);
    const uint32_t count = r.u32be();
    check_count(r, count, 8, "stts");

    std::vector<uint32_t> deltas;
    for (uint32_t i = 0; i < count && deltas.size() < max_samples; ++i) {
        const uint32_t n = r.u32be();
        const uint32_t delta = r.u32be();
        const size_t take = std::min<size_t>(n, max_samples - deltas.size());
        deltas.insert(deltas.end(), take, delta);
    }
    return deltas;
}

std::vector<Mp4Sample> build_samples(const SampleTable& table, uint32_t timescale) {
    std::vector<Mp4Sample> samples;
    samples.reserve(table.sizes.size());

    size_t sample_idx = 0;
    size_t stsc_idx = 0;
    for (size_t chunk_idx = 0; chunk_idx < table.chunk_offsets.size(); ++chunk_idx) {
        const uint32_t chunk_no = static_cast<uint32_t>(chunk_idx + 1);
        while (stsc_idx + 1 < table.stsc.size() && table.stsc[stsc_idx + 1].first_chunk <= chunk_no) {
            ++stsc_idx;
        }
        if (table.stsc.empty() || table.stsc[stsc_idx].first_chunk > chunk_no) {
            continue;
        }
        const StscEntry& entry = table.stsc[stsc_idx];

        std::string format;
        if (entry.description_index >= 1 && entry.description_index <= table.formats.size()) {
            format = table.formats[entry.description_index - 1];
        }

        uint64_t offset = table.chunk_offsets[chunk_idx];
        for (uint32_t j = 0; j < entry.samples_per_chunk && sample_idx < table.sizes.size(); ++j) {
            Mp4Sample s;
            s.offset = offset;
            s.size = table.sizes[sample_idx];
            s.format = format;
            samples.push_back(s);
            offset += s.size;
            ++sample_idx;
        }
    }

    uint64_t elapsed = 0;
    for (size_t i = 0; i < samples.size(); ++i) {
        const uint32_t delta = i < table.deltas.size() ? table.deltas[i] : 0;
        samples[i].exact_time = static_cast<double>(elapsed) / timescale;
        samples[i].duration = static_cast<double>(delta) / timescale;
        elapsed += delta;
    }
    return samples;
}

uint32_t parse_mdhd_timescale(const Box& box) {
    ByteReader r(box.data, box.data_size);
    const uint8_t version = r.u8();
    r.skip(3);
    r.skip(version == 1 ? 16 : 8);
    return r.u32be();
}

std::string parse_hdlr(const Box& box) {
    ByteReader r(box.data, box.data_size);
    r.skip(8); // version + flags, pre_defined
    return r.fourcc();
}

Mp4Track parse_trak(const Box& trak) {
    Mp4Track track;

    auto mdia = find_box(trak.data, trak.data_size, {"mdia"});
    if (!mdia) {
        return track;
    }
    if (auto mdhd = find_box(mdia->data, mdia->data_size, {"mdhd"})) {
        track.timescale = parse_mdhd_timescale(*mdhd);
    }
    if (auto hdlr = find_box(mdia->data, mdia->data_size, {"hdlr"})) {
        track.handler_type = parse_hdlr(*hdlr);
    }

    auto stbl = find_box(mdia->data, mdia->data_size, {"minf", "stbl"});
    if (!stbl) {
        return track;
    }

    SampleTable table;
    for (const auto& box : parse_boxes(stbl->data, stbl->data_size)) {
        if (box.type == "stsd") {
            table.formats = parse_stsd(box);
        } else if (box.type == "stsz") {
            table.sizes = parse_stsz(box);
        } else if (box.type == "stco") {
            table.chunk_offsets = parse_chunk_offsets(box, false);
        } else if (box.type == "co64") {
            table.chunk_offsets = parse_chunk_offsets(box, true);
        } else if (box.type == "stsc") {
            table.stsc = parse_stsc(box);
        }
    }
    if (auto stts = find_box(stbl->data, stbl->data_size, {"stts"})) {
        table.deltas = parse_stts(*stts, table.sizes.size());
    }

    track.formats = table.formats;
    if (!table.sizes.empty()) {
        if (track.timescale == 0) {
            throw ParseError("Track with samples has zero timescale");
        }
        track.samples = build_samples(table, track.timescale);
    }
    return track;
}

} // namespace

std::vector<Box> parse_boxes(const uint8_t* data, size_t size) {
    std::vector<Box> boxes;
    ByteReader r(data, size);

    while (r.remaining() >= 8) {
        Box box;
        box.offset = r.pos();
        const uint32_t size32 = r.u32be();
        box.type = r.fourcc();

        uint64_t box_size = size32;
        box.header_size = 8;
        if (size32 == 1) {
            box_size = r.u64be();
            box.header_size = 16;
        } else if (size32 == 0) {
            box_size = size - box.offset;
        }

        if (box_size < box.header_size) {
            throw ParseError("Invalid size " + std::to_string(box_size) + " for box '" + box.type + "'");
        }
        if (box_size > size - box.offset) {
            throw ParseError("Box '" + box.type + "' extends past the end of its parent");
        }

        box.size = static_cast<size_t>(box_size);
        box.data = data + box.offset + box.header_size;
        box.data_size = box.size - box.header_size;
        boxes.push_back(box);
        r.seek(box.offset + box.size);
    }

    return boxes;
}

std::optional<Box> find_box(const uint8_t* data, size_t size, const std::vector<std::string>& path) {
    if (path.empty()) {
        return std::nullopt;
    }
    for (const auto& box : parse_boxes(data, size)) {
        if (box.type != path.front()) {
            continue;
        }
        if (path.size() == 1) {
            return box;
        }
        std::vector<std::string> rest(path.begin() + 1, path.end());
        if (auto found = find_box(box.data, box.data_size, rest)) {
            return found;
        }
    }
    return std::nullopt;
}

bool Mp4Track::has_format(const std::string& fmt) const {
    return std::find(formats.begin(), formats.end(), fmt) != formats.end();
}

Mp4Movie parse_moov(const uint8_t* data, size_t size) {
    Mp4Movie movie;

    for (const auto& box : parse_boxes(data, size)) {
        if (box.type == "mvhd") {
            ByteReader r(box.data, box.data_size);
            const uint8_t version = r.u8();
            r.skip(3);
            uint64_t creation = 0;
            uint64_t duration = 0;
            if (version == 1) {
                creation = r.u64be();
                r.skip(8);
                movie.timescale = r.u32be();
                duration = r.u64be();
            } else {
                creation = r.u32be();
                r.skip(4);
                movie.timescale = r.u32be();
                duration = r.u32be();
            }
            if (creation > MP4_EPOCH_OFFSET) {
                movie.creation_time = static_cast<double>(creation - MP4_EPOCH_OFFSET);
            }
            if (movie.timescale > 0) {
                movie.duration = static_cast<double>(duration) / movie.timescale;
            }
        } else if (box.type == "trak") {
            movie.tracks.push_back(parse_trak(box));
        }
    }

    return movie;
}

Mp4Reader::Mp4Reader(const fs::path& path)
    : path_(path), file_(path, std::ios::binary) {
    if (!file_) {
        throw IOError("Cannot open file: " + path.string());
    }
    file_.seekg(0, std::ios::end);
    length_ = static_cast<uint64_t>(file_.tellg());
    file_.seekg(0, std::ios::beg);
    scan();
}

Mp4Reader::Mp4Reader(std::vector<uint8_t> bytes)
    : buffer_(std::move(bytes)), in_memory_(true) {
    length_ = buffer_.size();
    scan();
}

void Mp4Reader::scan() {
    uint64_t pos = 0;
    while (pos + 8 <= length_) {
        std::vector<uint8_t> header = read_range(pos, std::min<uint64_t>(16, length_ - pos));
        ByteReader r(header.data(), header.size());

        TopLevelBox box;
        box.offset = pos;
        const uint32_t size32 = r.u32be();
        box.type = r.fourcc();
        box.size = size32;
        if (size32 == 1) {
            box.size = r.u64be();
            box.header_size = 16;
        } else if (size32 == 0) {
            box.size = length_ - pos;
        }

        if (box.size < box.header_size) {
            throw ParseError("Invalid size for top level box '" + box.type + "'");
        }
        if (box.size > length_ - pos) {
            throw ParseError("Truncated container: box '" + box.type + "' extends past end of file");
        }
        boxes_.push_back(box);
        pos += box.size;
    }

    if (boxes_.empty()) {
        throw ParseError("Not an MP4 container: no boxes found");
    }
}

std::vector<uint8_t> Mp4Reader::read_range(uint64_t offset, uint64_t size) {
    if (offset > length_ || size > length_ - offset) {
        throw ParseError("Read past end of container at offset " + std::to_string(offset));
    }
    if (size > MAX_PAYLOAD_READ) {
        throw ParseError("Refusing to read " + std::to_string(size) + " bytes from container");
    }

    if (in_memory_) {
        return std::vector<uint8_t>(buffer_.begin() + static_cast<std::ptrdiff_t>(offset),
                                    buffer_.begin() + static_cast<std::ptrdiff_t>(offset + size));
    }

    std::vector<uint8_t> out(static_cast<size_t>(size));
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (size > 0 && !file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size))) {
        throw IOError("Cannot read file: " + path_.string());
    }
    return out;
}

std::optional<std::vector<uint8_t>> Mp4Reader::read_top_level(const std::string& type) {
    for (const auto& box : boxes_) {
        if (box.type == type) {
            return read_range(box.offset + box.header_size, box.size - box.header_size);
        }
    }
    return std::nullopt;
}

const std::vector<uint8_t>& Mp4Reader::moov_bytes() {
    if (!moov_) {
        auto moov = read_top_level("moov");
        if (!moov) {
            throw ParseError("No moov box found");
        }
        moov_ = std::move(*moov);
    }
    return *moov_;
}

const Mp4Movie& Mp4Reader::movie() {
    if (!movie_) {
        const auto& moov = moov_bytes();
        movie_ = parse_moov(moov.data(), moov.size());
    }
    return *movie_;
}

} // namespace geoseq::io
