#pragma once

#include "geoseq/config/configuration.hpp"
#include "geoseq/core/types.hpp"

#include <vector>

namespace geoseq::sequence {

constexpr int MAX_SEQUENCE_LENGTH = 500;

// Captures without errors grouped by (directory, make, model, width, height), each group in time order.
// Equal-millisecond times are spread within the group.
std::vector<std::vector<size_t>> group_captures(std::vector<CaptureRecord>& records);

// Splits one time-ordered group on cutoff_time, cutoff_distance and the length cap
std::vector<std::vector<size_t>> split_group(const std::vector<CaptureRecord>& records,
                                             const std::vector<size_t>& group,
                                             const config::SequenceConfig& cfg);

/**
 * Builds image sequences over all successful image captures and assigns each a
 * fresh UUID. Every video capture forms a sequence of its own. Sequence ids are
 * written into the records; no record is dropped.
 */
std::vector<Sequence> build_sequences(std::vector<CaptureRecord>& records,
                                      const config::SequenceConfig& cfg);

} // namespace geoseq::sequence
