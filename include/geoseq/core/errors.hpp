#pragma once

#include <stdexcept>
#include <string>

namespace geoseq {

class GeoseqError : public std::runtime_error {
public:
    explicit GeoseqError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public GeoseqError {
public:
    explicit ConfigError(const std::string& message)
        : GeoseqError("Config error: " + message) {}
};

class ValidationError : public GeoseqError {
public:
    explicit ValidationError(const std::string& message)
        : GeoseqError("Validation error: " + message) {}
};

class IOError : public GeoseqError {
public:
    explicit IOError(const std::string& message)
        : GeoseqError("I/O error: " + message) {}
};

// Malformed or absent telemetry in one candidate source.
class ParseError : public GeoseqError {
public:
    explicit ParseError(const std::string& message)
        : GeoseqError(message) {}
};

// No usable telemetry source at all for a file.
class GeotaggingError : public GeoseqError {
public:
    explicit GeotaggingError(const std::string& message)
        : GeoseqError(message) {}
};

class OutsideTrackError : public GeoseqError {
public:
    explicit OutsideTrackError(const std::string& message)
        : GeoseqError(message) {}
};

class AlignmentError : public GeoseqError {
public:
    explicit AlignmentError(const std::string& message)
        : GeoseqError(message) {}
};

class StationaryVideoError : public GeoseqError {
public:
    explicit StationaryVideoError(const std::string& message)
        : GeoseqError(message) {}
};

class GPSNoiseError : public GeoseqError {
public:
    explicit GPSNoiseError(const std::string& message)
        : GeoseqError(message) {}
};

class NullIslandError : public GeoseqError {
public:
    explicit NullIslandError(const std::string& message)
        : GeoseqError(message) {}
};

class CaptureSpeedTooFastError : public GeoseqError {
public:
    explicit CaptureSpeedTooFastError(const std::string& message)
        : GeoseqError(message) {}
};

class MetadataValidationError : public GeoseqError {
public:
    explicit MetadataValidationError(const std::string& message)
        : GeoseqError(message) {}
};

// A required external binary is missing and no other source can stand in.
class ToolUnavailableError : public GeoseqError {
public:
    explicit ToolUnavailableError(const std::string& message)
        : GeoseqError("Tool unavailable: " + message) {}
};

} // namespace geoseq
