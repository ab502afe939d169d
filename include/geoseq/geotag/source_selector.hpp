#pragma once

#include "geoseq/io/exiftool.hpp"
#include "geoseq/telemetry/telemetry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace geoseq::geotag {

/**
 * Expands a source pattern for a media file: %f is the file name, %g the
 * file name without extension and %e the extension including the dot.
 * Relative results resolve against the media file's directory.
 */
fs::path expand_source_pattern(const fs::path& media, const std::string& pattern);

// Expanded pattern if it names an existing regular file
std::optional<fs::path> resolve_source_path(const fs::path& media, const std::string& pattern);

// A fixed pattern would make every video read the same companion file.
// Throws ConfigError when more than one video is processed with such a pattern.
void check_source_patterns(const std::vector<SourceSpec>& specs, size_t video_count);

struct SelectedTrack {
    telemetry::TelemetryResult telemetry;
    SourceKind source = SourceKind::VIDEO;
    fs::path source_path;
};

/**
 * Tries each configured source in order and returns the first track with at
 * least one point. Parser failures fall through to the next source; when all
 * fail a GeotaggingError carrying the last failure message is thrown.
 */
class SourceSelector {
public:
    // runner may be null when exiftool is unavailable
    explicit SourceSelector(io::ExiftoolRunner* runner = nullptr) : runner_(runner) {}

    SelectedTrack select(const fs::path& media, const std::vector<SourceSpec>& specs) const;

    // Single source parse; throws ParseError (or IOError) on failure
    telemetry::TelemetryResult parse(SourceKind kind, const fs::path& source_path,
                                     const fs::path& media) const;

private:
    io::ExiftoolRunner* runner_;
};

} // namespace geoseq::geotag
