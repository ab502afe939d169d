#include "geoseq/telemetry/nmea_parser.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/utils.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace geoseq::telemetry {

namespace {

constexpr double KNOTS_TO_MS = 0.514444;

// "ddmm.mmmm" / "dddmm.mmmm" plus hemisphere
std::optional<double> parse_coordinate(const std::string& value, const std::string& hemisphere,
                                       int degree_digits) {
    if (value.size() <= static_cast<size_t>(degree_digits) || hemisphere.empty()) {
        return std::nullopt;
    }
    auto degrees = core::parse_double(value.substr(0, degree_digits));
    auto minutes = core::parse_double(value.substr(degree_digits));
    if (!degrees || !minutes || *minutes >= 60.0) {
        return std::nullopt;
    }
    double result = *degrees + *minutes / 60.0;
    if (hemisphere == "S" || hemisphere == "W") {
        result = -result;
    } else if (hemisphere != "N" && hemisphere != "E") {
        return std::nullopt;
    }
    return result;
}

// "hhmmss[.sss]"
std::optional<double> parse_time_of_day(const std::string& value) {
    if (value.size() < 6) {
        return std::nullopt;
    }
    auto hh = core::parse_double(value.substr(0, 2));
    auto mm = core::parse_double(value.substr(2, 2));
    auto ss = core::parse_double(value.substr(4));
    if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss >= 61.0) {
        return std::nullopt;
    }
    return *hh * 3600.0 + *mm * 60.0 + *ss;
}

// "ddmmyy"
std::optional<NmeaDate> parse_date(const std::string& value) {
    if (value.size() != 6) {
        return std::nullopt;
    }
    NmeaDate d;
    if (std::sscanf(value.c_str(), "%2d%2d%2d", &d.day, &d.month, &d.year) != 3) {
        return std::nullopt;
    }
    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > 31) {
        return std::nullopt;
    }
    d.year += 2000;
    return d;
}

const std::string& field(const NmeaSentence& s, size_t idx) {
    static const std::string empty;
    return idx < s.fields.size() ? s.fields[idx] : empty;
}

} // namespace

std::optional<NmeaSentence> parse_nmea_sentence(const std::string& raw) {
    std::string line = core::trim(raw);
    if (line.size() < 7 || line[0] != '$') {
        return std::nullopt;
    }

    const auto star = line.find('*');
    std::string body = line.substr(1, star == std::string::npos ? std::string::npos : star - 1);
    if (star != std::string::npos) {
        const std::string given = line.substr(star + 1, 2);
        unsigned expected = 0;
        for (char c : body) {
            expected ^= static_cast<unsigned char>(c);
        }
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02X", expected);
        if (core::to_lower(given) != core::to_lower(buf)) {
            return std::nullopt;
        }
    }

    std::vector<std::string> parts = core::split(body, ',');
    if (parts.empty() || parts[0].size() != 5) {
        return std::nullopt;
    }
    NmeaSentence s;
    s.talker = parts[0].substr(0, 2);
    s.type = parts[0].substr(2);
    s.fields.assign(parts.begin() + 1, parts.end());
    return s;
}

std::optional<NmeaFix> parse_rmc(const NmeaSentence& s) {
    // time, status, lat, N/S, lon, E/W, speed (knots), course, date
    if (s.type != "RMC" || field(s, 1) != "A") {
        return std::nullopt;
    }
    auto tod = parse_time_of_day(field(s, 0));
    auto lat = parse_coordinate(field(s, 2), field(s, 3), 2);
    auto lon = parse_coordinate(field(s, 4), field(s, 5), 3);
    auto date = parse_date(field(s, 8));
    if (!tod || !lat || !lon || !date) {
        return std::nullopt;
    }
    NmeaFix fix;
    fix.time_of_day = *tod;
    fix.date = date;
    fix.lat = *lat;
    fix.lon = *lon;
    if (auto knots = core::parse_double(field(s, 6))) {
        fix.speed = *knots * KNOTS_TO_MS;
    }
    fix.course = core::parse_double(field(s, 7));
    return fix;
}

std::optional<NmeaFix> parse_gga(const NmeaSentence& s) {
    // time, lat, N/S, lon, E/W, quality, satellites, hdop, altitude, M, ...
    if (s.type != "GGA") {
        return std::nullopt;
    }
    auto quality = core::parse_double(field(s, 5));
    if (!quality || *quality < 1.0) {
        return std::nullopt;
    }
    auto tod = parse_time_of_day(field(s, 0));
    auto lat = parse_coordinate(field(s, 1), field(s, 2), 2);
    auto lon = parse_coordinate(field(s, 3), field(s, 4), 3);
    if (!tod || !lat || !lon) {
        return std::nullopt;
    }
    NmeaFix fix;
    fix.time_of_day = *tod;
    fix.lat = *lat;
    fix.lon = *lon;
    fix.alt = core::parse_double(field(s, 8));
    fix.fix = GPSFix::FIX_3D;
    return fix;
}

std::optional<NmeaFix> parse_gll(const NmeaSentence& s) {
    // lat, N/S, lon, E/W, time, status
    if (s.type != "GLL" || field(s, 5) != "A") {
        return std::nullopt;
    }
    auto lat = parse_coordinate(field(s, 0), field(s, 1), 2);
    auto lon = parse_coordinate(field(s, 2), field(s, 3), 3);
    auto tod = parse_time_of_day(field(s, 4));
    if (!tod || !lat || !lon) {
        return std::nullopt;
    }
    NmeaFix fix;
    fix.time_of_day = *tod;
    fix.lat = *lat;
    fix.lon = *lon;
    return fix;
}

Track parse_nmea_text(const std::string& text) {
    std::optional<NmeaDate> date;
    std::vector<NmeaFix> pending;
    std::vector<std::optional<NmeaDate>> pending_dates;

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        auto sentence = parse_nmea_sentence(line);
        if (!sentence) {
            continue;
        }
        if (sentence->type == "RMC") {
            if (auto rmc = parse_rmc(*sentence)) {
                date = rmc->date;
            }
        } else if (sentence->type == "GGA") {
            if (auto gga = parse_gga(*sentence)) {
                pending.push_back(*gga);
                pending_dates.push_back(date);
            }
        }
    }

    // GGA lines logged before the first RMC take the first known date
    std::optional<NmeaDate> first_date;
    for (const auto& d : pending_dates) {
        if (d) {
            first_date = d;
            break;
        }
    }
    if (!first_date) {
        first_date = date;
    }

    Track track;
    for (size_t i = 0; i < pending.size(); ++i) {
        const auto& d = pending_dates[i] ? pending_dates[i] : first_date;
        if (!d) {
            continue;
        }
        GPSPoint p;
        p.time = core::unix_time_from_utc(d->year, d->month, d->day, 0, 0, pending[i].time_of_day);
        p.lat = pending[i].lat;
        p.lon = pending[i].lon;
        p.alt = pending[i].alt;
        p.fix = pending[i].fix;
        track.push_back(p);
    }

    if (track.empty()) {
        throw ParseError("No dated GGA fixes found in NMEA data");
    }
    std::stable_sort(track.begin(), track.end(),
                     [](const GPSPoint& a, const GPSPoint& b) { return a.time < b.time; });
    return track;
}

Track parse_nmea_file(const fs::path& path) {
    return parse_nmea_text(core::read_text(path));
}

} // namespace geoseq::telemetry
