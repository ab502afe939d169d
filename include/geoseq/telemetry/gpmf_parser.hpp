#pragma once

#include "geoseq/io/mp4_reader.hpp"
#include "geoseq/telemetry/telemetry.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace geoseq::telemetry {

/**
 * One GPMF key-length-value entry. Nested entries (type 0) are parsed into
 * children; payload pointers refer to the buffer given to parse_gpmf and are
 * only valid while it lives.
 */
struct KLV {
    std::string key;
    char type = 0;
    uint8_t struct_size = 0;
    uint16_t repeat = 0;
    const uint8_t* data = nullptr;
    size_t data_size = 0;
    std::vector<KLV> children;
};

std::vector<KLV> parse_gpmf(const uint8_t* data, size_t size);

// GPS points of one STRM (GPS9 or GPS5). time is left at 0; GPS5 carries
// the GPSU epoch on its first point only.
std::vector<GPSPoint> gps9_from_stream(const std::vector<KLV>& stream);
std::vector<GPSPoint> gps5_from_stream(const std::vector<KLV>& stream);

// GPS track of the first device in the first gpmd track. Throws ParseError
// when the container holds no GoPro GPS.
TelemetryResult parse_gopro(io::Mp4Reader& reader);

} // namespace geoseq::telemetry
