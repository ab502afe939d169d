#include "geoseq/telemetry/blackvue_parser.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/utils.hpp"
#include "geoseq/telemetry/nmea_parser.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <sstream>
#include <utility>

namespace geoseq::telemetry {

namespace {

struct TimedSentence {
    int64_t camera_ms = 0;
    NmeaSentence sentence;
};

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// "[camera_ms]$XXXXX,...[*hh]" with an optional trailing "[n]"
std::optional<std::pair<std::string, std::string>> split_line(const std::string& raw) {
    const std::string line = core::trim(raw);
    if (line.empty() || line.front() != '[') {
        return std::nullopt;
    }
    const size_t close = line.find(']');
    if (close == std::string::npos || !all_digits(line.substr(1, close - 1))) {
        return std::nullopt;
    }
    std::string sentence = core::trim(line.substr(close + 1));
    if (!sentence.empty() && sentence.back() == ']') {
        const size_t open = sentence.rfind('[');
        if (open != std::string::npos && all_digits(sentence.substr(open + 1, sentence.size() - open - 2))) {
            sentence = core::trim(sentence.substr(0, open));
        }
    }
    if (sentence.size() < 6 || sentence.front() != '$' ||
        !std::all_of(sentence.begin() + 1, sentence.begin() + 6,
                     [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; })) {
        return std::nullopt;
    }
    return std::make_pair(line.substr(1, close - 1), sentence);
}

std::vector<TimedSentence> read_lines(const std::string& gps_data) {
    std::vector<TimedSentence> out;
    std::istringstream iss(gps_data);
    std::string line;
    while (std::getline(iss, line)) {
        auto parts = split_line(line);
        if (!parts) {
            continue;
        }
        auto sentence = parse_nmea_sentence(parts->second);
        if (!sentence) {
            continue;
        }
        TimedSentence ts;
        try {
            ts.camera_ms = std::stoll(parts->first);
        } catch (const std::out_of_range&) {
            continue;
        }
        ts.sentence = std::move(*sentence);
        out.push_back(std::move(ts));
    }
    return out;
}

double round_ms(double seconds) {
    return std::round(seconds * 1000.0) / 1000.0;
}

double timezone_offset(const std::vector<TimedSentence>& lines) {
    for (const auto& l : lines) {
        if (l.sentence.type != "RMC") continue;
        if (auto rmc = parse_rmc(l.sentence)) {
            const double utc = core::unix_time_from_utc(rmc->date->year, rmc->date->month,
                                                        rmc->date->day, 0, 0, rmc->time_of_day);
            return round_ms(l.camera_ms / 1000.0 - utc);
        }
    }

    for (const auto& l : lines) {
        std::optional<NmeaFix> fix;
        if (l.sentence.type == "GGA") fix = parse_gga(l.sentence);
        else if (l.sentence.type == "GLL") fix = parse_gll(l.sentence);
        if (!fix) continue;

        // Time of day only: take the date from the camera clock
        const double camera = l.camera_ms / 1000.0;
        const double midnight = std::floor(camera / 86400.0) * 86400.0;
        double offset = camera - (midnight + fix->time_of_day);
        if (offset > 12 * 3600.0) {
            offset -= 86400.0;
        } else if (offset < -12 * 3600.0) {
            offset += 86400.0;
        }
        return round_ms(offset);
    }

    return 0.0;
}

} // namespace

double blackvue_timezone_offset(const std::string& gps_data) {
    return timezone_offset(read_lines(gps_data));
}

Track parse_blackvue_gps_data(const std::string& gps_data) {
    const auto lines = read_lines(gps_data);
    const double offset = timezone_offset(lines);

    Track rmc_points;
    Track gga_points;
    Track gll_points;
    for (const auto& l : lines) {
        const auto& s = l.sentence;
        std::optional<NmeaFix> fix;
        Track* target = nullptr;
        if (s.type == "RMC") {
            fix = parse_rmc(s);
            target = &rmc_points;
        } else if (s.type == "GGA") {
            fix = parse_gga(s);
            target = &gga_points;
        } else if (s.type == "GLL") {
            fix = parse_gll(s);
            target = &gll_points;
        }
        if (!fix) continue;

        GPSPoint p;
        p.time = l.camera_ms / 1000.0 - offset;
        p.lat = fix->lat;
        p.lon = fix->lon;
        p.alt = fix->alt;
        p.fix = fix->fix;
        p.ground_speed = fix->speed;
        target->push_back(p);
    }

    Track& chosen = !rmc_points.empty() ? rmc_points : (!gga_points.empty() ? gga_points : gll_points);
    std::stable_sort(chosen.begin(), chosen.end(),
                     [](const GPSPoint& a, const GPSPoint& b) { return a.time < b.time; });
    return chosen;
}

std::string parse_blackvue_model(const std::string& cprt_raw) {
    std::string cprt = core::trim(cprt_raw);
    if (cprt.empty()) {
        return "";
    }

    auto json = nlohmann::json::parse(cprt, nullptr, false);
    if (!json.is_discarded() && json.is_object()) {
        if (json.contains("model")) {
            const auto& m = json["model"];
            return core::trim(m.is_string() ? m.get<std::string>() : m.dump());
        }
        return "";
    }

    auto fields = core::split(cprt, ';');
    if (fields.size() >= 2) {
        return core::trim(fields[1]);
    }
    return "";
}

TelemetryResult parse_blackvue(io::Mp4Reader& reader) {
    // Plain padding "free" boxes may precede the one holding the camera data
    for (const auto& top : reader.top_level()) {
        if (top.type != "free") {
            continue;
        }
        const std::vector<uint8_t> payload = reader.read_range(top.offset + top.header_size,
                                                               top.size - top.header_size);
        std::optional<io::Box> gps;
        try {
            gps = io::find_box(payload.data(), payload.size(), {"gps "});
        } catch (const ParseError&) {
            continue;
        }
        if (!gps) {
            continue;
        }

        const std::string gps_data(reinterpret_cast<const char*>(gps->data), gps->data_size);
        TelemetryResult result;
        result.points = parse_blackvue_gps_data(gps_data);
        if (result.points.empty()) {
            throw ParseError("BlackVue gps box contains no valid fixes");
        }

        result.make = "BlackVue";
        if (auto cprt = io::find_box(payload.data(), payload.size(), {"cprt"})) {
            result.model = parse_blackvue_model(
                std::string(reinterpret_cast<const char*>(cprt->data), cprt->data_size));
        }
        return result;
    }

    throw ParseError("No BlackVue gps box found");
}

} // namespace geoseq::telemetry
