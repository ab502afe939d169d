#pragma once

#include "geoseq/config/configuration.hpp"
#include "geoseq/core/types.hpp"

#include <vector>

namespace geoseq::sequence {

// Total travelled distance over total elapsed time, m/s. Infinite when
// points move without time passing.
double average_speed(const std::vector<const CaptureRecord*>& ordered);
double average_speed(const Track& track);

bool is_null_island(double lat, double lon);

/**
 * Rejects whole sequences: one (0, 0) capture turns every member into a
 * NullIslandError, an average speed above max_capture_speed_kmh into a
 * CaptureSpeedTooFastError. Returns the number of rejected sequences.
 */
size_t apply_sequence_limits(std::vector<CaptureRecord>& records, const std::vector<Sequence>& sequences,
                             const config::SequenceConfig& cfg);

// Same checks over a video's GPS track; throws NullIslandError or CaptureSpeedTooFastError
void check_track_limits(const Track& track, const config::SequenceConfig& cfg);

} // namespace geoseq::sequence
