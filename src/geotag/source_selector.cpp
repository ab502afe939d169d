#include "geoseq/geotag/source_selector.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/utils.hpp"
#include "geoseq/io/metadata_record.hpp"
#include "geoseq/io/mp4_reader.hpp"
#include "geoseq/telemetry/blackvue_parser.hpp"
#include "geoseq/telemetry/camm_parser.hpp"
#include "geoseq/telemetry/exiftool_video.hpp"
#include "geoseq/telemetry/gpmf_parser.hpp"
#include "geoseq/telemetry/gpx_parser.hpp"
#include "geoseq/telemetry/nmea_parser.hpp"

#include <iostream>

namespace geoseq::geotag {

fs::path expand_source_pattern(const fs::path& media, const std::string& pattern) {
    const std::string full = media.filename().string();
    const std::string stem = media.stem().string();
    const std::string ext = media.extension().string();

    std::string out;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '%' && i + 1 < pattern.size()) {
            const char token = pattern[i + 1];
            if (token == 'f') { out += full; ++i; continue; }
            if (token == 'g') { out += stem; ++i; continue; }
            if (token == 'e') { out += ext; ++i; continue; }
        }
        out += pattern[i];
    }

    fs::path p(out);
    if (p.is_relative()) {
        p = media.parent_path() / p;
    }
    return p;
}

std::optional<fs::path> resolve_source_path(const fs::path& media, const std::string& pattern) {
    fs::path p = expand_source_pattern(media, pattern);
    std::error_code ec;
    if (fs::is_regular_file(p, ec) && !ec) {
        return p;
    }
    return std::nullopt;
}

void check_source_patterns(const std::vector<SourceSpec>& specs, size_t video_count) {
    if (video_count <= 1) {
        return;
    }
    for (const auto& spec : specs) {
        const std::string pattern = spec.effective_pattern();
        if (pattern.find('%') == std::string::npos) {
            throw ConfigError("Source pattern '" + pattern + "' of " + source_kind_to_string(spec.kind) +
                              " has no %f, %g or %e token but " + std::to_string(video_count) +
                              " videos are being processed");
        }
    }
}

telemetry::TelemetryResult SourceSelector::parse(SourceKind kind, const fs::path& source_path,
                                                 const fs::path& media) const {
    switch (kind) {
        case SourceKind::VIDEO: {
            io::Mp4Reader reader(source_path);
            std::string last_error;
            using Parser = telemetry::TelemetryResult (*)(io::Mp4Reader&);
            const Parser parsers[] = {&telemetry::parse_camm, &telemetry::parse_gopro,
                                      &telemetry::parse_blackvue};
            for (Parser parser : parsers) {
                try {
                    auto result = parser(reader);
                    if (!result.points.empty()) {
                        return result;
                    }
                } catch (const ParseError& e) {
                    last_error = e.what();
                }
            }
            throw ParseError(last_error.empty() ? "No embedded GPS track found" : last_error);
        }
        case SourceKind::CAMM: {
            io::Mp4Reader reader(source_path);
            return telemetry::parse_camm(reader);
        }
        case SourceKind::GOPRO: {
            io::Mp4Reader reader(source_path);
            return telemetry::parse_gopro(reader);
        }
        case SourceKind::BLACKVUE: {
            io::Mp4Reader reader(source_path);
            return telemetry::parse_blackvue(reader);
        }
        case SourceKind::GPX: {
            telemetry::TelemetryResult result;
            result.points = telemetry::parse_gpx_file(source_path);
            return result;
        }
        case SourceKind::NMEA: {
            telemetry::TelemetryResult result;
            result.points = telemetry::parse_nmea_file(source_path);
            return result;
        }
        case SourceKind::EXIFTOOL_XML: {
            const auto records = io::parse_exiftool_xml(core::read_text(source_path));
            const io::MetadataRecord* record = find_record_for(records, media);
            if (!record && records.size() == 1) {
                record = &records.front();
            }
            if (!record) {
                throw ParseError("No entry for " + media.filename().string() + " in " +
                                 source_path.string());
            }
            return telemetry::parse_exiftool_video(*record);
        }
        case SourceKind::EXIFTOOL_RUNTIME: {
            if (!runner_) {
                throw ParseError("exiftool is not available");
            }
            const auto records = io::parse_exiftool_xml(runner_->run(source_path));
            if (records.empty()) {
                throw ParseError("exiftool reported no metadata for " + source_path.string());
            }
            return telemetry::parse_exiftool_video(records.front());
        }
        case SourceKind::EXIF:
            break;
    }
    throw ParseError("Source " + source_kind_to_string(kind) + " cannot geotag videos");
}

SelectedTrack SourceSelector::select(const fs::path& media, const std::vector<SourceSpec>& specs) const {
    std::string last_error = "No geotag source configured";

    for (const auto& spec : specs) {
        const std::string pattern = spec.effective_pattern();
        auto source_path = resolve_source_path(media, pattern);
        if (!source_path) {
            last_error = source_kind_to_string(spec.kind) + " source not found: " +
                         expand_source_pattern(media, pattern).string();
            continue;
        }

        try {
            SelectedTrack selected;
            selected.telemetry = parse(spec.kind, *source_path, media);
            if (selected.telemetry.points.empty()) {
                last_error = "Empty GPS track from " + source_kind_to_string(spec.kind);
                continue;
            }
            selected.source = spec.kind;
            selected.source_path = *source_path;
            return selected;
        } catch (const ParseError& e) {
            last_error = e.what();
        } catch (const IOError& e) {
            last_error = e.what();
        }
        std::cerr << "[SOURCE] " << media.filename().string() << ": "
                  << source_kind_to_string(spec.kind) << " failed: " << last_error << std::endl;
    }

    throw GeotaggingError(last_error);
}

} // namespace geoseq::geotag
