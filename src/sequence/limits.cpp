#include "geoseq/sequence/limits.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/geo.hpp"

#include <cstdio>
#include <iostream>
#include <limits>

namespace geoseq::sequence {

namespace {

template <typename T, typename Get>
double speed_over(const std::vector<T>& items, Get get) {
    if (items.size() < 2) {
        return 0.0;
    }
    double distance = 0.0;
    for (size_t i = 1; i < items.size(); ++i) {
        const auto& a = get(items[i - 1]);
        const auto& b = get(items[i]);
        distance += core::haversine_distance(a.lat, a.lon, b.lat, b.lon);
    }
    const double dt = get(items.back()).time - get(items.front()).time;
    if (dt <= 0.0) {
        return distance > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return distance / dt;
}

std::string speed_message(double kmh, double max_kmh) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "Capture speed %.3f km/h exceeds max allowed %.3f km/h", kmh, max_kmh);
    return buf;
}

} // namespace

double average_speed(const std::vector<const CaptureRecord*>& ordered) {
    return speed_over(ordered, [](const CaptureRecord* r) -> const CaptureRecord& { return *r; });
}

double average_speed(const Track& track) {
    return speed_over(track, [](const GPSPoint& p) -> const GPSPoint& { return p; });
}

bool is_null_island(double lat, double lon) {
    return lat == 0.0 && lon == 0.0;
}

size_t apply_sequence_limits(std::vector<CaptureRecord>& records, const std::vector<Sequence>& sequences,
                             const config::SequenceConfig& cfg) {
    size_t rejected = 0;
    for (const auto& seq : sequences) {
        std::vector<const CaptureRecord*> members;
        bool null_island = false;
        for (size_t i : seq.members) {
            members.push_back(&records[i]);
            null_island = null_island || is_null_island(records[i].lat, records[i].lon);
        }

        std::optional<CaptureError> error;
        if (null_island) {
            error = CaptureError{ErrorKind::NULL_ISLAND, "GPS coordinates in Null Island (0, 0)"};
        } else {
            const double kmh = average_speed(members) * 3.6;
            if (members.size() >= 2 && kmh > cfg.max_capture_speed_kmh) {
                error = CaptureError{ErrorKind::CAPTURE_SPEED_TOO_FAST,
                                     speed_message(kmh, cfg.max_capture_speed_kmh)};
            }
        }

        if (error) {
            std::cerr << "[SEQ] Sequence " << seq.id << " rejected: " << error->message << std::endl;
            for (size_t i : seq.members) {
                records[i].error = error;
            }
            ++rejected;
        }
    }
    return rejected;
}

void check_track_limits(const Track& track, const config::SequenceConfig& cfg) {
    for (const auto& p : track) {
        if (is_null_island(p.lat, p.lon)) {
            throw NullIslandError("GPS coordinates in Null Island (0, 0)");
        }
    }
    const double kmh = average_speed(track) * 3.6;
    if (track.size() >= 2 && kmh > cfg.max_capture_speed_kmh) {
        throw CaptureSpeedTooFastError(speed_message(kmh, cfg.max_capture_speed_kmh));
    }
}

} // namespace geoseq::sequence
