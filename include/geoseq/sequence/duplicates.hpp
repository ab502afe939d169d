#pragma once

#include "geoseq/config/configuration.hpp"
#include "geoseq/core/types.hpp"

#include <vector>

namespace geoseq::sequence {

// True when cur repeats prev: closer than duplicate_distance and, unless
// duplicate_angle >= 360, turned by less than duplicate_angle
bool is_duplicate_of(const CaptureRecord& prev, const CaptureRecord& cur,
                     const config::SequenceConfig& cfg);

// Flags duplicates within each sequence; returns how many were flagged
size_t mark_duplicates(std::vector<CaptureRecord>& records, const std::vector<Sequence>& sequences,
                       const config::SequenceConfig& cfg);

// Derives headings over the non-duplicate members of each sequence.
// Duplicates without a heading take the heading of the capture they repeat.
void assign_directions(std::vector<CaptureRecord>& records, const std::vector<Sequence>& sequences,
                       const config::SequenceConfig& cfg);

} // namespace geoseq::sequence
