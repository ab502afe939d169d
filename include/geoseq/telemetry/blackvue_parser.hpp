#pragma once

#include "geoseq/io/mp4_reader.hpp"
#include "geoseq/telemetry/telemetry.hpp"

#include <string>

namespace geoseq::telemetry {

// Camera clock minus UTC in seconds, derived from the NMEA lines of a gps box
double blackvue_timezone_offset(const std::string& gps_data);

// Track from the "[unix_ms]$NMEA..." lines of a BlackVue gps box
Track parse_blackvue_gps_data(const std::string& gps_data);

// Model from the free/cprt box: JSON {"model": ...} or ";"-separated fields
std::string parse_blackvue_model(const std::string& cprt);

// Throws ParseError when the container has no BlackVue GPS box or no fixes
TelemetryResult parse_blackvue(io::Mp4Reader& reader);

} // namespace geoseq::telemetry
