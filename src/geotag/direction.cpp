#include "geoseq/geotag/direction.hpp"
#include "geoseq/core/geo.hpp"

namespace geoseq::geotag {

void derive_directions(std::vector<CaptureRecord*>& ordered, const config::SequenceConfig& cfg) {
    if (ordered.size() < 2) {
        return;
    }

    double bearing = 0.0;
    for (size_t i = 0; i < ordered.size(); ++i) {
        CaptureRecord* cur = ordered[i];
        if (i + 1 < ordered.size()) {
            const CaptureRecord* next = ordered[i + 1];
            bearing = core::compute_bearing(cur->lat, cur->lon, next->lat, next->lon);
        }
        if (cfg.interpolate_directions || !cur->angle) {
            cur->angle = core::normalize_bearing(bearing + cfg.offset_angle);
        }
    }
}

} // namespace geoseq::geotag
