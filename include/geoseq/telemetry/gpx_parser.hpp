#pragma once

#include "geoseq/core/types.hpp"

#include <string>

namespace geoseq::telemetry {

// All trkpt elements of all tracks, sorted by time. Throws ParseError for
// malformed XML or a document without timed points.
Track parse_gpx_text(const std::string& xml);

Track parse_gpx_file(const fs::path& path);

} // namespace geoseq::telemetry
