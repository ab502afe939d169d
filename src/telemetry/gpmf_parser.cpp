#include "geoseq/telemetry/gpmf_parser.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/utils.hpp"
#include "geoseq/io/byte_reader.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <map>

namespace geoseq::telemetry {

namespace {

constexpr uint64_t DEFAULT_DEVICE_ID = 1ULL << 32;
constexpr double EPOCH_2000 = 946684800.0;

size_t type_size(char type) {
    switch (type) {
        case 'b': case 'B': case 'c': return 1;
        case 's': case 'S': return 2;
        case 'l': case 'L': case 'f': case 'q': case 'F': return 4;
        case 'd': case 'j': case 'J': case 'Q': return 8;
        case 'G': case 'U': return 16;
        default: return 0;
    }
}

double read_value(io::ByteReader& r, char type) {
    switch (type) {
        case 'b': return static_cast<int8_t>(r.u8());
        case 'B': case 'c': return r.u8();
        case 's': return r.i16be();
        case 'S': return r.u16be();
        case 'l': return r.i32be();
        case 'L': case 'q': return r.u32be();
        case 'f': return r.f32be();
        case 'd': return r.f64be();
        case 'j': return static_cast<double>(r.i64be());
        case 'J': case 'Q': return static_cast<double>(r.u64be());
        default:
            throw ParseError(std::string("Non-numeric GPMF type '") + type + "'");
    }
}

// Numeric values of a KLV, one row per repeat
std::vector<std::vector<double>> numeric_rows(const KLV& klv) {
    const size_t size = type_size(klv.type);
    if (size == 0 || klv.type == 'F' || klv.type == 'G' || klv.type == 'U') {
        throw ParseError("GPMF key " + klv.key + " is not numeric");
    }
    const size_t per_row = klv.struct_size / size;

    std::vector<std::vector<double>> rows;
    io::ByteReader r(klv.data, klv.data_size);
    for (uint16_t i = 0; i < klv.repeat; ++i) {
        const size_t row_start = r.pos();
        std::vector<double> row;
        row.reserve(per_row);
        for (size_t j = 0; j < per_row; ++j) {
            row.push_back(read_value(r, klv.type));
        }
        r.seek(row_start + klv.struct_size);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<double> flatten(const std::vector<std::vector<double>>& rows) {
    std::vector<double> out;
    for (const auto& row : rows) {
        out.insert(out.end(), row.begin(), row.end());
    }
    return out;
}

std::string klv_string(const KLV& klv) {
    std::string s(reinterpret_cast<const char*>(klv.data), klv.data_size);
    s.erase(std::find(s.begin(), s.end(), '\0'), s.end());
    return s;
}

// Later entries override earlier ones, like a keyed lookup over the stream
const KLV* find_klv(const std::vector<KLV>& stream, const std::string& key) {
    const KLV* found = nullptr;
    for (const auto& klv : stream) {
        if (klv.key == key) {
            found = &klv;
        }
    }
    return found;
}

std::optional<GPSFix> to_fix(double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 3.0) {
        return std::nullopt;
    }
    switch (static_cast<int>(value)) {
        case 0: return GPSFix::NO_FIX;
        case 2: return GPSFix::FIX_2D;
        case 3: return GPSFix::FIX_3D;
        default: return std::nullopt;
    }
}

// Scale factors for n values; empty when the stream must be skipped
std::vector<double> read_scales(const std::vector<KLV>& stream, size_t n) {
    const KLV* scal = find_klv(stream, "SCAL");
    if (!scal) {
        return {};
    }
    std::vector<double> scales = flatten(numeric_rows(*scal));
    if (scales.empty() || std::any_of(scales.begin(), scales.end(), [](double s) { return s == 0.0; })) {
        return {};
    }
    if (scales.size() == 1) {
        scales.assign(n, scales.front());
    }
    if (scales.size() < n) {
        return {};
    }
    return scales;
}

// "yymmddhhmmss.sss" in UTC
std::optional<double> parse_gpsu(const std::string& text) {
    if (text.size() < 12 ||
        !std::all_of(text.begin(), text.begin() + 12, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    int yy = 0, mo = 0, dd = 0, hh = 0, mi = 0;
    double ss = 0.0;
    if (std::sscanf(text.c_str(), "%2d%2d%2d%2d%2d%lf", &yy, &mo, &dd, &hh, &mi, &ss) != 6) {
        return std::nullopt;
    }
    if (mo < 1 || mo > 12 || dd < 1 || dd > 31 || hh > 23 || mi > 59 || ss >= 61.0) {
        return std::nullopt;
    }
    return core::unix_time_from_utc(2000 + yy, mo, dd, hh, mi, ss);
}

void backfill_forward(Track& points) {
    const GPSPoint* last = nullptr;
    for (auto& p : points) {
        if (!last) {
            if (p.epoch_time) last = &p;
            continue;
        }
        if (!p.epoch_time) {
            p.epoch_time = *last->epoch_time + (p.time - last->time);
        }
        last = &p;
    }
}

void backfill_backward(Track& points) {
    const GPSPoint* last = nullptr;
    for (auto it = points.rbegin(); it != points.rend(); ++it) {
        if (!last) {
            if (it->epoch_time) last = &*it;
            continue;
        }
        if (!it->epoch_time) {
            it->epoch_time = *last->epoch_time + (it->time - last->time);
        }
        last = &*it;
    }
}

uint64_t device_id(const std::vector<KLV>& device) {
    for (const auto& klv : device) {
        if (klv.key == "DVID") {
            auto rows = numeric_rows(klv);
            if (!rows.empty() && !rows.front().empty()) {
                const double id = rows.front().front();
                if (!std::isfinite(id) || id < 0.0 || id >= 18446744073709551616.0) {
                    return DEFAULT_DEVICE_ID;
                }
                return static_cast<uint64_t>(id);
            }
        }
    }
    return DEFAULT_DEVICE_ID;
}

std::vector<GPSPoint> first_gps_stream(const std::vector<KLV>& device) {
    for (const auto& klv : device) {
        if (klv.key != "STRM") {
            continue;
        }
        auto points = gps9_from_stream(klv.children);
        if (!points.empty()) {
            return points;
        }
        points = gps5_from_stream(klv.children);
        if (!points.empty()) {
            return points;
        }
    }
    return {};
}

std::string pick_model(const std::vector<std::string>& names) {
    if (names.empty()) {
        return "";
    }
    for (const char* needle : {"hero", "gopro"}) {
        for (const auto& name : names) {
            if (core::to_lower(name).find(needle) != std::string::npos) {
                return name;
            }
        }
    }
    std::vector<std::string> sorted = names;
    std::sort(sorted.begin(), sorted.end());
    return sorted.front();
}

} // namespace

std::vector<KLV> parse_gpmf(const uint8_t* data, size_t size) {
    std::vector<KLV> out;
    io::ByteReader r(data, size);

    while (r.remaining() >= 8) {
        KLV klv;
        klv.key = r.fourcc();
        if (klv.key == std::string(4, '\0')) {
            break; // trailing padding
        }
        klv.type = static_cast<char>(r.u8());
        klv.struct_size = r.u8();
        klv.repeat = r.u16be();

        const size_t payload = static_cast<size_t>(klv.struct_size) * klv.repeat;
        const size_t padded = (payload + 3) & ~static_cast<size_t>(3);
        if (payload > r.remaining()) {
            throw ParseError("GPMF entry " + klv.key + " exceeds its container");
        }
        klv.data = r.current();
        klv.data_size = payload;
        if (klv.type == 0) {
            klv.children = parse_gpmf(klv.data, klv.data_size);
        }
        r.skip(std::min(padded, r.remaining()));
        out.push_back(std::move(klv));
    }
    return out;
}

std::vector<GPSPoint> gps5_from_stream(const std::vector<KLV>& stream) {
    const KLV* gps5 = find_klv(stream, "GPS5");
    if (!gps5) {
        return {};
    }
    const std::vector<double> scales = read_scales(stream, 5);
    if (scales.empty()) {
        return {};
    }

    std::optional<GPSFix> fix;
    if (const KLV* gpsf = find_klv(stream, "GPSF")) {
        auto values = flatten(numeric_rows(*gpsf));
        if (!values.empty()) fix = to_fix(values.front());
    }

    std::optional<double> epoch;
    if (const KLV* gpsu = find_klv(stream, "GPSU")) {
        epoch = parse_gpsu(klv_string(*gpsu));
    }

    std::optional<double> precision;
    if (const KLV* gpsp = find_klv(stream, "GPSP")) {
        auto values = flatten(numeric_rows(*gpsp));
        if (!values.empty()) precision = values.front();
    }

    std::vector<GPSPoint> points;
    for (const auto& row : numeric_rows(*gps5)) {
        if (row.size() < 5) {
            throw ParseError("GPS5 entry with " + std::to_string(row.size()) + " values");
        }
        GPSPoint p;
        p.lat = row[0] / scales[0];
        p.lon = row[1] / scales[1];
        p.alt = row[2] / scales[2];
        p.ground_speed = row[3] / scales[3];
        p.fix = fix;
        p.precision = precision;
        // GPSU stamps the start of the payload; the rest is back-filled from sample timing
        if (points.empty()) {
            p.epoch_time = epoch;
        }
        points.push_back(p);
    }
    return points;
}

std::vector<GPSPoint> gps9_from_stream(const std::vector<KLV>& stream) {
    constexpr size_t NUM_VALUES = 9;

    const KLV* gps9 = find_klv(stream, "GPS9");
    if (!gps9) {
        return {};
    }
    const std::vector<double> scales = read_scales(stream, NUM_VALUES);
    if (scales.empty()) {
        return {};
    }
    const KLV* type_klv = find_klv(stream, "TYPE");
    if (!type_klv) {
        return {};
    }
    const std::string types = klv_string(*type_klv);
    if (types.empty()) {
        return {};
    }
    if (types.size() != NUM_VALUES) {
        throw ParseError("GPS9 TYPE '" + types + "' does not declare " +
                         std::to_string(NUM_VALUES) + " values");
    }

    std::vector<GPSPoint> points;
    io::ByteReader r(gps9->data, gps9->data_size);
    for (uint16_t i = 0; i < gps9->repeat; ++i) {
        const size_t row_start = r.pos();
        double v[NUM_VALUES];
        for (size_t j = 0; j < NUM_VALUES; ++j) {
            v[j] = read_value(r, types[j]) / scales[j];
        }
        r.seek(row_start + gps9->struct_size);

        GPSPoint p;
        p.lat = v[0];
        p.lon = v[1];
        p.alt = v[2];
        p.ground_speed = v[3];
        p.epoch_time = EPOCH_2000 + v[5] * 86400.0 + v[6];
        p.precision = v[7] * 100.0;
        p.fix = to_fix(v[8]);
        points.push_back(p);
    }
    return points;
}

TelemetryResult parse_gopro(io::Mp4Reader& reader) {
    const io::Mp4Movie& movie = reader.movie();

    for (const auto& track : movie.tracks) {
        if (!track.has_format("gpmd")) {
            continue;
        }

        std::map<uint64_t, Track> points_by_device;
        std::vector<uint64_t> device_order;
        std::vector<std::string> names;

        for (const auto& sample : track.samples) {
            if (sample.format != "gpmd") {
                continue;
            }
            const std::vector<uint8_t> bytes = reader.read_range(sample.offset, sample.size);
            const std::vector<KLV> klvs = parse_gpmf(bytes.data(), bytes.size());

            for (const auto& devc : klvs) {
                if (devc.key != "DEVC") {
                    continue;
                }
                const uint64_t dvid = device_id(devc.children);
                for (const auto& klv : devc.children) {
                    if (klv.key == "DVNM" && klv.data_size > 0) {
                        const std::string name = core::trim(klv_string(klv));
                        if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
                            names.push_back(name);
                        }
                    }
                }

                std::vector<GPSPoint> sample_points = first_gps_stream(devc.children);
                if (sample_points.empty()) {
                    continue;
                }
                const double step = sample.duration / static_cast<double>(sample_points.size());
                for (size_t idx = 0; idx < sample_points.size(); ++idx) {
                    sample_points[idx].time = sample.exact_time + step * static_cast<double>(idx);
                }
                if (points_by_device.find(dvid) == points_by_device.end()) {
                    device_order.push_back(dvid);
                }
                auto& device_points = points_by_device[dvid];
                device_points.insert(device_points.end(), sample_points.begin(), sample_points.end());
            }
        }

        if (device_order.empty()) {
            continue;
        }

        Track gps = points_by_device[device_order.front()];
        backfill_forward(gps);
        backfill_backward(gps);

        if (gps.front().epoch_time) {
            for (auto& p : gps) {
                p.time = *p.epoch_time;
            }
        } else if (movie.creation_time) {
            for (auto& p : gps) {
                p.time += *movie.creation_time;
            }
        } else {
            throw ParseError("GoPro GPS has neither GPS time nor container creation time");
        }

        TelemetryResult result;
        result.points = std::move(gps);
        result.make = "GoPro";
        result.model = pick_model(names);
        return result;
    }

    throw ParseError("No GoPro GPS data found");
}

} // namespace geoseq::telemetry
