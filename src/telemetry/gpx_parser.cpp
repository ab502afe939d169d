#include "geoseq/telemetry/gpx_parser.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/geo.hpp"
#include "geoseq/core/utils.hpp"

#include <QString>
#include <QXmlStreamReader>

#include <algorithm>
#include <iostream>

namespace geoseq::telemetry {

namespace {

std::optional<double> attribute_double(const QXmlStreamReader& xml, const char* name) {
    const auto value = xml.attributes().value(QLatin1String(name));
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return core::parse_double(value.toString().toStdString());
}

// Reads one trkpt; the reader is positioned on its start element
std::optional<GPSPoint> read_trkpt(QXmlStreamReader& xml) {
    auto lat = attribute_double(xml, "lat");
    auto lon = attribute_double(xml, "lon");

    GPSPoint p;
    std::optional<double> time;
    int depth = 1;
    while (depth > 0 && !xml.atEnd()) {
        const auto token = xml.readNext();
        if (token == QXmlStreamReader::EndElement) {
            --depth;
        } else if (token == QXmlStreamReader::StartElement) {
            const auto name = xml.name();
            if (name == QLatin1String("ele")) {
                p.alt = core::parse_double(xml.readElementText().toStdString());
            } else if (name == QLatin1String("time")) {
                time = core::parse_iso8601(xml.readElementText().toStdString());
            } else if (name == QLatin1String("course")) {
                if (auto course = core::parse_double(xml.readElementText().toStdString())) {
                    p.angle = core::normalize_bearing(*course);
                }
            } else {
                ++depth;
            }
        }
    }

    if (!lat || !lon || !time) {
        return std::nullopt;
    }
    p.lat = *lat;
    p.lon = *lon;
    p.time = *time;
    return p;
}

} // namespace

Track parse_gpx_text(const std::string& text) {
    QXmlStreamReader xml(QString::fromStdString(text));

    Track track;
    int track_count = 0;
    size_t skipped = 0;
    while (!xml.atEnd()) {
        const auto token = xml.readNext();
        if (token != QXmlStreamReader::StartElement) {
            continue;
        }
        if (xml.name() == QLatin1String("trk")) {
            ++track_count;
        } else if (xml.name() == QLatin1String("trkpt")) {
            if (auto p = read_trkpt(xml)) {
                track.push_back(*p);
            } else {
                ++skipped;
            }
        }
    }

    if (xml.hasError()) {
        throw ParseError("Invalid GPX: " + xml.errorString().toStdString() + " at line " +
                         std::to_string(xml.lineNumber()));
    }
    if (track_count > 1) {
        std::cerr << "[GPX] Found " << track_count << " tracks; merging them into one" << std::endl;
    }
    if (skipped > 0) {
        std::cerr << "[GPX] Skipped " << skipped << " track points without position or time" << std::endl;
    }
    if (track.empty()) {
        throw ParseError("GPX contains no timed track points");
    }

    std::stable_sort(track.begin(), track.end(),
                     [](const GPSPoint& a, const GPSPoint& b) { return a.time < b.time; });
    return track;
}

Track parse_gpx_file(const fs::path& path) {
    return parse_gpx_text(core::read_text(path));
}

} // namespace geoseq::telemetry
