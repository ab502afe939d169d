#include "geoseq/sequence/duplicates.hpp"
#include "geoseq/core/geo.hpp"
#include "geoseq/geotag/direction.hpp"

#include <iostream>

namespace geoseq::sequence {

bool is_duplicate_of(const CaptureRecord& prev, const CaptureRecord& cur,
                     const config::SequenceConfig& cfg) {
    const double distance = core::haversine_distance(prev.lat, prev.lon, cur.lat, cur.lon);
    if (!(distance < cfg.duplicate_distance)) {
        return false;
    }
    if (cfg.duplicate_angle >= 360.0 || !prev.angle || !cur.angle) {
        return true;
    }
    return core::diff_bearing(*prev.angle, *cur.angle) < cfg.duplicate_angle;
}

size_t mark_duplicates(std::vector<CaptureRecord>& records, const std::vector<Sequence>& sequences,
                       const config::SequenceConfig& cfg) {
    size_t count = 0;
    for (const auto& seq : sequences) {
        for (size_t i = 1; i < seq.members.size(); ++i) {
            CaptureRecord& cur = records[seq.members[i]];
            if (is_duplicate_of(records[seq.members[i - 1]], cur, cfg)) {
                cur.is_duplicate = true;
                ++count;
            }
        }
    }
    if (count > 0) {
        std::cerr << "[SEQ] " << count << " duplicates flagged (distance < " << cfg.duplicate_distance
                  << " m, angle < " << cfg.duplicate_angle << " deg)" << std::endl;
    }
    return count;
}

void assign_directions(std::vector<CaptureRecord>& records, const std::vector<Sequence>& sequences,
                       const config::SequenceConfig& cfg) {
    for (const auto& seq : sequences) {
        std::vector<CaptureRecord*> kept;
        for (size_t i : seq.members) {
            if (!records[i].is_duplicate) {
                kept.push_back(&records[i]);
            }
        }
        geotag::derive_directions(kept, cfg);

        const CaptureRecord* last_kept = nullptr;
        for (size_t i : seq.members) {
            CaptureRecord& r = records[i];
            if (!r.is_duplicate) {
                last_kept = &r;
            } else if (last_kept && (!r.angle || cfg.interpolate_directions)) {
                r.angle = last_kept->angle;
            }
        }
    }
}

} // namespace geoseq::sequence
