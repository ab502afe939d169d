#pragma once

#include "geoseq/config/configuration.hpp"
#include "geoseq/core/types.hpp"

#include <vector>

namespace geoseq::geotag {

/**
 * Bearing of each capture towards the next one in the given (time-ordered)
 * list; the last capture reuses the previous bearing. offset_angle is added
 * and the result normalized to [0, 360). Existing headings are kept unless
 * interpolate_directions is set.
 */
void derive_directions(std::vector<CaptureRecord*>& ordered, const config::SequenceConfig& cfg);

} // namespace geoseq::geotag
