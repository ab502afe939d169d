#include "geoseq/telemetry/camm_parser.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/utils.hpp"
#include "geoseq/io/byte_reader.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace geoseq::telemetry {

namespace {

// "\xa9mak" style atom: u16 size, u16 language, text
std::string parse_quicktime_text(const io::Box& box) {
    io::ByteReader r(box.data, box.data_size);
    const uint16_t size = r.u16be();
    r.skip(2);
    std::string text = r.str(std::min<size_t>(size, r.remaining()));
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

std::string raw_text(const io::Box& box) {
    return std::string(reinterpret_cast<const char*>(box.data), box.data_size);
}

} // namespace

std::optional<GPSPoint> parse_camm_sample(const uint8_t* data, size_t size) {
    io::ByteReader r(data, size);
    r.skip(2); // reserved
    const auto type = static_cast<CammType>(r.u16le());

    if (type == CammType::MIN_GPS) {
        GPSPoint p;
        p.lat = r.f64le();
        p.lon = r.f64le();
        p.alt = r.f64le();
        return p;
    }
    if (type == CammType::GPS) {
        const double time_gps_epoch = r.f64le();
        const int32_t fix_type = r.i32le();
        GPSPoint p;
        p.lat = r.f64le();
        p.lon = r.f64le();
        p.alt = r.f32le();
        r.skip(8); // horizontal and vertical accuracy
        const float velocity_east = r.f32le();
        const float velocity_north = r.f32le();
        r.skip(8); // velocity up, speed accuracy

        if (time_gps_epoch > 0.0) {
            p.epoch_time = time_gps_epoch;
        }
        if (fix_type == 0) p.fix = GPSFix::NO_FIX;
        else if (fix_type == 2) p.fix = GPSFix::FIX_2D;
        else if (fix_type == 3) p.fix = GPSFix::FIX_3D;
        p.ground_speed = std::hypot(static_cast<double>(velocity_east), static_cast<double>(velocity_north));
        return p;
    }
    return std::nullopt;
}

std::pair<std::string, std::string> extract_camm_make_model(io::Mp4Reader& reader) {
    std::string make;
    std::string model;

    const auto& moov = reader.moov_bytes();
    auto udta = io::find_box(moov.data(), moov.size(), {"udta"});
    if (!udta) {
        return {make, model};
    }

    try {
        for (const auto& box : io::parse_boxes(udta->data, udta->data_size)) {
            if (box.type == "\xa9mak") {
                make = parse_quicktime_text(box);
            } else if (box.type == "\xa9mod") {
                model = parse_quicktime_text(box);
            } else if (box.type == "@mak" || box.type == "manu") {
                make = raw_text(box);
            } else if (box.type == "@mod" || box.type == "modl") {
                model = raw_text(box);
            }
            if (!make.empty() && !model.empty()) {
                break;
            }
        }
    } catch (const ParseError& e) {
        std::cerr << "[CAMM] Ignoring malformed udta: " << e.what() << std::endl;
    }

    return {core::trim(make), core::trim(model)};
}

TelemetryResult parse_camm(io::Mp4Reader& reader) {
    const io::Mp4Movie& movie = reader.movie();

    for (const auto& track : movie.tracks) {
        if (!track.has_format("camm")) {
            continue;
        }

        Track points;
        for (const auto& sample : track.samples) {
            if (sample.format != "camm") {
                continue;
            }
            const std::vector<uint8_t> bytes = reader.read_range(sample.offset, sample.size);
            if (auto p = parse_camm_sample(bytes.data(), bytes.size())) {
                p->time = sample.exact_time;
                points.push_back(*p);
            }
        }
        if (points.empty()) {
            continue;
        }

        if (!movie.creation_time) {
            throw ParseError("CAMM track without container creation time");
        }
        for (auto& p : points) {
            p.time += *movie.creation_time;
        }

        TelemetryResult result;
        result.points = std::move(points);
        auto [make, model] = extract_camm_make_model(reader);
        result.make = make;
        result.model = model;
        return result;
    }

    throw ParseError("No CAMM GPS data found");
}

} // namespace geoseq::telemetry
