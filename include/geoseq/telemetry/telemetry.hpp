#pragma once

#include "geoseq/core/types.hpp"

#include <string>

namespace geoseq::telemetry {

// Output of one telemetry parser: an absolute-time track plus device info
struct TelemetryResult {
    Track points;
    std::string make;
    std::string model;
};

} // namespace geoseq::telemetry
