#pragma once

#include "geoseq/io/metadata_record.hpp"
#include "geoseq/telemetry/telemetry.hpp"

#include <string>
#include <utility>

namespace geoseq::telemetry {

constexpr int MAX_EXIFTOOL_TRACK_ID = 10;

// Make and model: GoPro tags, then Insta360, then IFD0/UserData/Keys
std::pair<std::string, std::string> exiftool_make_model(const io::MetadataRecord& record);

/**
 * GPS track from exiftool -ee output of a video. Tries QuickTime GPS lists,
 * then Insta360 lists, then per-sample Track1..Track10 tags (anchored on the
 * container creation date). Throws ParseError if none yields points.
 */
TelemetryResult parse_exiftool_video(const io::MetadataRecord& record);

} // namespace geoseq::telemetry
