#pragma once

#include "geoseq/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace geoseq::telemetry {

struct NmeaSentence {
    std::string talker; // "GP", "GN", ...
    std::string type;   // "RMC", "GGA", "GLL", ...
    std::vector<std::string> fields; // after the address field
};

// Splits "$GPGGA,...*hh". A present but wrong checksum rejects the sentence.
std::optional<NmeaSentence> parse_nmea_sentence(const std::string& line);

struct NmeaDate {
    int year = 0;
    int month = 0;
    int day = 0;
};

// Position report decoded from RMC, GGA or GLL
struct NmeaFix {
    double time_of_day = 0.0; // seconds since UTC midnight
    std::optional<NmeaDate> date; // RMC only
    double lat = 0.0;
    double lon = 0.0;
    std::optional<double> alt; // GGA only
    std::optional<GPSFix> fix;
    std::optional<double> course;
    std::optional<double> speed; // m/s
};

// Each returns nullopt for void fixes or missing fields
std::optional<NmeaFix> parse_rmc(const NmeaSentence& s);
std::optional<NmeaFix> parse_gga(const NmeaSentence& s);
std::optional<NmeaFix> parse_gll(const NmeaSentence& s);

// Track from an NMEA log: RMC sentences provide the date, GGA the points.
// Throws ParseError if no point can be dated.
Track parse_nmea_text(const std::string& text);

Track parse_nmea_file(const fs::path& path);

} // namespace geoseq::telemetry
