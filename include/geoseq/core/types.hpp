#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace geoseq {

namespace fs = std::filesystem;

// GPS fix reported by the receiver
enum class GPSFix {
    NO_FIX = 0,
    FIX_2D = 2,
    FIX_3D = 3
};

// One telemetry sample. time is UTC unix seconds.
struct GPSPoint {
    double time = 0.0;
    double lat = 0.0;
    double lon = 0.0;
    std::optional<double> alt;
    std::optional<double> angle;        // heading, degrees [0, 360)

    // Receiver extras, used by the noise filter
    std::optional<double> epoch_time;
    std::optional<GPSFix> fix;
    std::optional<double> precision;    // DOP x 100
    std::optional<double> ground_speed; // m/s
};

using Track = std::vector<GPSPoint>;

// Telemetry source kinds
enum class SourceKind {
    VIDEO,
    CAMM,
    GOPRO,
    BLACKVUE,
    GPX,
    NMEA,
    EXIFTOOL_XML,
    EXIFTOOL_RUNTIME,
    EXIF
};

inline std::string source_kind_to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::VIDEO: return "video";
        case SourceKind::CAMM: return "camm";
        case SourceKind::GOPRO: return "gopro";
        case SourceKind::BLACKVUE: return "blackvue";
        case SourceKind::GPX: return "gpx";
        case SourceKind::NMEA: return "nmea";
        case SourceKind::EXIFTOOL_XML: return "exiftool_xml";
        case SourceKind::EXIFTOOL_RUNTIME: return "exiftool_runtime";
        case SourceKind::EXIF: return "exif";
        default: return "unknown";
    }
}

inline std::optional<SourceKind> string_to_source_kind(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "video") return SourceKind::VIDEO;
    if (norm == "camm") return SourceKind::CAMM;
    if (norm == "gopro") return SourceKind::GOPRO;
    if (norm == "blackvue") return SourceKind::BLACKVUE;
    if (norm == "gpx") return SourceKind::GPX;
    if (norm == "nmea") return SourceKind::NMEA;
    if (norm == "exiftool_xml") return SourceKind::EXIFTOOL_XML;
    if (norm == "exiftool_runtime") return SourceKind::EXIFTOOL_RUNTIME;
    if (norm == "exif") return SourceKind::EXIF;
    return std::nullopt;
}

// Companion file pattern used when a source entry does not name one
inline std::string default_source_pattern(SourceKind kind) {
    switch (kind) {
        case SourceKind::GPX: return "%g.gpx";
        case SourceKind::NMEA: return "%g.nmea";
        case SourceKind::EXIFTOOL_XML: return "%g.xml";
        default: return "%f";
    }
}

struct SourceSpec {
    SourceKind kind = SourceKind::VIDEO;
    std::string pattern; // empty = default_source_pattern(kind)

    std::string effective_pattern() const {
        return pattern.empty() ? default_source_pattern(kind) : pattern;
    }
};

enum class FileType {
    IMAGE,
    VIDEO
};

// Per-file failure kinds, reported as error.type in the output
enum class ErrorKind {
    PARSE,
    GEOTAGGING,
    OUTSIDE_TRACK,
    ALIGNMENT,
    STATIONARY_VIDEO,
    GPS_NOISE,
    NULL_ISLAND,
    CAPTURE_SPEED_TOO_FAST,
    METADATA_VALIDATION,
    IO,
    UNKNOWN
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PARSE: return "ParseError";
        case ErrorKind::GEOTAGGING: return "GeotaggingError";
        case ErrorKind::OUTSIDE_TRACK: return "OutsideTrackError";
        case ErrorKind::ALIGNMENT: return "AlignmentError";
        case ErrorKind::STATIONARY_VIDEO: return "StationaryVideoError";
        case ErrorKind::GPS_NOISE: return "GPSNoiseError";
        case ErrorKind::NULL_ISLAND: return "NullIslandError";
        case ErrorKind::CAPTURE_SPEED_TOO_FAST: return "CaptureSpeedTooFastError";
        case ErrorKind::METADATA_VALIDATION: return "MetadataValidationError";
        case ErrorKind::IO: return "IOError";
        default: return "UnknownError";
    }
}

struct CaptureError {
    ErrorKind kind = ErrorKind::UNKNOWN;
    std::string message;
};

// One discovered media file, annotated in place by the pipeline stages
struct CaptureRecord {
    fs::path filename;
    FileType filetype = FileType::IMAGE;

    double raw_time = 0.0;  // as read from the source
    double time = 0.0;      // corrected: raw + offset

    double lat = 0.0;
    double lon = 0.0;
    std::optional<double> alt;
    std::optional<double> angle;

    std::string make;
    std::string model;
    std::optional<int> orientation;
    std::optional<double> gps_accuracy;
    int width = 0;
    int height = 0;

    std::string sequence_id;
    bool is_duplicate = false;
    std::optional<CaptureError> error;

    bool ok() const { return !error.has_value(); }
};

// View over the capture set: members are indices into it
struct Sequence {
    std::string id;
    std::vector<size_t> members;
};

// Pipeline phase enumeration
enum class Phase {
    DISCOVER = 0,
    GEOTAG = 1,
    SEQUENCE = 2,
    ASSEMBLE = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::DISCOVER: return "DISCOVER";
        case Phase::GEOTAG: return "GEOTAG";
        case Phase::SEQUENCE: return "SEQUENCE";
        case Phase::ASSEMBLE: return "ASSEMBLE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace geoseq
