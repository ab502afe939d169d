#include "geoseq/telemetry/exiftool_video.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/geo.hpp"
#include "geoseq/core/utils.hpp"

#include <algorithm>
#include <iostream>

namespace geoseq::telemetry {

namespace {

std::optional<std::string> first_of(const io::MetadataRecord& record,
                                    std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto v = record.get(key)) {
            return core::trim(*v);
        }
    }
    return std::nullopt;
}

std::vector<std::optional<double>> doubles_padded(const std::vector<std::string>& texts, size_t n) {
    std::vector<std::optional<double>> out;
    for (const auto& t : texts) {
        out.push_back(core::parse_double(t));
    }
    out.resize(std::max(out.size(), n));
    return out;
}

bool same_point(const GPSPoint& a, const GPSPoint& b) {
    return a.time == b.time && a.lat == b.lat && a.lon == b.lon && a.angle == b.angle;
}

// Parallel GPS lists of a namespace, with absolute GPSDateTime stamps
Track track_from_lists(const io::MetadataRecord& record, const std::string& ns) {
    const auto times = record.get_all(ns + ":GPSDateTime");
    const auto lats = record.get_all(ns + ":GPSLatitude");
    const auto lons = record.get_all(ns + ":GPSLongitude");
    if (times.empty() || lats.empty() || lons.empty()) {
        return {};
    }
    if (lats.size() != lons.size() || times.size() != lats.size()) {
        std::cerr << "[EXIFTOOL] " << ns << " GPS lists differ in length (" << times.size()
                  << " times, " << lats.size() << " latitudes, " << lons.size()
                  << " longitudes)" << std::endl;
        return {};
    }

    const size_t n = lats.size();
    const auto alts = doubles_padded(record.get_all(ns + ":GPSAltitude"), n);
    const auto tracks = doubles_padded(record.get_all(ns + ":GPSTrack"), n);

    Track track;
    for (size_t i = 0; i < n; ++i) {
        auto t = core::parse_exif_datetime(times[i]);
        auto lat = core::parse_double(lats[i]);
        auto lon = core::parse_double(lons[i]);
        if (!t || !lat || !lon) {
            continue;
        }
        GPSPoint p;
        p.time = *t;
        p.lat = *lat;
        p.lon = *lon;
        p.alt = alts[i];
        if (tracks[i]) p.angle = core::normalize_bearing(*tracks[i]);
        if (track.empty() || !same_point(track.back(), p)) {
            track.push_back(p);
        }
    }
    std::stable_sort(track.begin(), track.end(),
                     [](const GPSPoint& a, const GPSPoint& b) { return a.time < b.time; });
    track.erase(std::unique(track.begin(), track.end(), same_point), track.end());
    return track;
}

struct SampleGroup {
    double time = 0.0;
    double duration = 0.0;
    std::vector<std::pair<std::string, std::string>> tags; // tag name without group
};

std::vector<SampleGroup> aggregate_samples(const io::MetadataRecord& record, const std::string& ns) {
    std::vector<SampleGroup> groups;
    std::optional<double> sample_time;
    std::optional<double> sample_duration;
    std::vector<std::pair<std::string, std::string>> tags;

    const std::string prefix = ns + ":";
    for (const auto& [key, value] : record.entries) {
        if (!core::starts_with(key, prefix)) {
            continue;
        }
        const std::string tag = key.substr(prefix.size());
        if (tag == "SampleTime") {
            if (sample_time && sample_duration) {
                groups.push_back({*sample_time, *sample_duration, tags});
            }
            tags.clear();
            sample_time = core::parse_double(value);
        } else if (tag == "SampleDuration") {
            sample_duration = core::parse_double(value);
        } else {
            tags.emplace_back(tag, value);
        }
    }
    if (sample_time && sample_duration) {
        groups.push_back({*sample_time, *sample_duration, tags});
    }
    return groups;
}

std::vector<std::string> tag_values(const SampleGroup& g, const std::string& tag) {
    std::vector<std::string> out;
    for (const auto& [k, v] : g.tags) {
        if (k == tag) out.push_back(v);
    }
    return out;
}

// Relative sample-time track of TrackN
Track track_from_samples(const io::MetadataRecord& record, const std::string& ns) {
    Track track;
    for (const auto& g : aggregate_samples(record, ns)) {
        const auto lats = tag_values(g, "GPSLatitude");
        const auto lons = tag_values(g, "GPSLongitude");
        if (lats.empty() || lats.size() != lons.size()) {
            continue;
        }
        const size_t n = lats.size();
        const auto alts = doubles_padded(tag_values(g, "GPSAltitude"), n);
        const auto dirs = doubles_padded(tag_values(g, "GPSTrack"), n);
        const auto speeds = doubles_padded(tag_values(g, "GPSSpeed"), n);

        std::optional<GPSFix> fix;
        const auto modes = tag_values(g, "GPSMeasureMode");
        if (!modes.empty()) {
            if (auto m = core::parse_double(modes.front())) {
                if (*m == 2.0) fix = GPSFix::FIX_2D;
                else if (*m == 3.0) fix = GPSFix::FIX_3D;
                else if (*m == 0.0) fix = GPSFix::NO_FIX;
            }
        }
        std::optional<double> precision;
        const auto errors = tag_values(g, "GPSHPositioningError");
        if (!errors.empty()) {
            if (auto e = core::parse_double(errors.front())) {
                precision = *e * 100.0;
            }
        }

        Track points;
        for (size_t i = 0; i < n; ++i) {
            auto lat = core::parse_double(lats[i]);
            auto lon = core::parse_double(lons[i]);
            if (!lat || !lon) continue;
            GPSPoint p;
            p.lat = *lat;
            p.lon = *lon;
            p.alt = alts[i];
            if (dirs[i]) p.angle = core::normalize_bearing(*dirs[i]);
            p.ground_speed = speeds[i];
            p.fix = fix;
            p.precision = precision;
            points.push_back(p);
        }
        const double step = points.empty() ? 0.0 : g.duration / static_cast<double>(points.size());
        for (size_t i = 0; i < points.size(); ++i) {
            points[i].time = g.time + static_cast<double>(i) * step;
        }
        track.insert(track.end(), points.begin(), points.end());
    }
    std::stable_sort(track.begin(), track.end(),
                     [](const GPSPoint& a, const GPSPoint& b) { return a.time < b.time; });
    return track;
}

std::optional<double> creation_time(const io::MetadataRecord& record, const std::string& ns) {
    for (const std::string key : {std::string("QuickTime:CreateDate"), std::string("QuickTime:MediaCreateDate"),
                                  ns + ":TrackCreateDate", ns + ":MediaCreateDate"}) {
        if (auto text = record.get(key)) {
            auto t = core::parse_exif_datetime(*text);
            // 0000:00:00 00:00:00 marks an unset date
            if (t && *t > 0.0) {
                return t;
            }
        }
    }
    return std::nullopt;
}

} // namespace

std::pair<std::string, std::string> exiftool_make_model(const io::MetadataRecord& record) {
    if (auto model = first_of(record, {"GoPro:Model"})) {
        return {first_of(record, {"GoPro:Make"}).value_or("GoPro"), *model};
    }
    if (auto model = first_of(record, {"Insta360:Model"})) {
        return {first_of(record, {"Insta360:Make"}).value_or("Insta360"), *model};
    }
    return {first_of(record, {"IFD0:Make", "UserData:Make", "Keys:Make"}).value_or(""),
            first_of(record, {"IFD0:Model", "UserData:Model", "Keys:Model"}).value_or("")};
}

TelemetryResult parse_exiftool_video(const io::MetadataRecord& record) {
    TelemetryResult result;
    std::tie(result.make, result.model) = exiftool_make_model(record);

    for (const char* ns : {"QuickTime", "Insta360"}) {
        result.points = track_from_lists(record, ns);
        if (!result.points.empty()) {
            return result;
        }
    }

    for (int id = 1; id <= MAX_EXIFTOOL_TRACK_ID; ++id) {
        const std::string ns = "Track" + std::to_string(id);
        if (!record.has(ns + ":SampleTime") || !record.has(ns + ":SampleDuration") ||
            !record.has(ns + ":GPSLatitude") || !record.has(ns + ":GPSLongitude")) {
            continue;
        }
        Track track = track_from_samples(record, ns);
        if (track.empty()) {
            continue;
        }
        auto start = creation_time(record, ns);
        if (!start) {
            throw ParseError(ns + " GPS samples found but the video has no creation date");
        }
        for (auto& p : track) {
            p.time += *start;
        }
        result.points = std::move(track);
        return result;
    }

    throw ParseError("No GPS track found in exiftool output");
}

} // namespace geoseq::telemetry
