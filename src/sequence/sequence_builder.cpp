#include "geoseq/sequence/sequence_builder.hpp"
#include "geoseq/core/geo.hpp"
#include "geoseq/core/utils.hpp"
#include "geoseq/telemetry/track_filters.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <tuple>

namespace geoseq::sequence {

std::vector<std::vector<size_t>> group_captures(std::vector<CaptureRecord>& records) {
    using Key = std::tuple<std::string, std::string, std::string, int, int>;
    std::map<Key, std::vector<size_t>> groups;

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        if (!r.ok() || r.filetype != FileType::IMAGE) {
            continue;
        }
        groups[Key{r.filename.parent_path().string(), r.make, r.model, r.width, r.height}].push_back(i);
    }

    std::vector<std::vector<size_t>> out;
    for (auto& [key, idx] : groups) {
        std::stable_sort(idx.begin(), idx.end(), [&records](size_t a, size_t b) {
            if (records[a].time != records[b].time) {
                return records[a].time < records[b].time;
            }
            return records[a].filename < records[b].filename;
        });

        std::vector<CaptureRecord*> ordered;
        ordered.reserve(idx.size());
        for (size_t i : idx) {
            ordered.push_back(&records[i]);
        }
        telemetry::interpolate_subseconds(ordered, [](CaptureRecord* r) -> double& { return r->time; });

        out.push_back(std::move(idx));
    }
    return out;
}

std::vector<std::vector<size_t>> split_group(const std::vector<CaptureRecord>& records,
                                             const std::vector<size_t>& group,
                                             const config::SequenceConfig& cfg) {
    const size_t max_len = static_cast<size_t>(
        std::clamp(cfg.max_sequence_length, 1, MAX_SEQUENCE_LENGTH));

    std::vector<std::vector<size_t>> out;
    std::vector<size_t> current;
    for (size_t idx : group) {
        if (!current.empty()) {
            const CaptureRecord& prev = records[current.back()];
            const CaptureRecord& cur = records[idx];
            const double dt = cur.time - prev.time;
            const double dist = core::haversine_distance(prev.lat, prev.lon, cur.lat, cur.lon);
            if (dt > cfg.cutoff_time || dist > cfg.cutoff_distance || current.size() >= max_len) {
                out.push_back(std::move(current));
                current.clear();
            }
        }
        current.push_back(idx);
    }
    if (!current.empty()) {
        out.push_back(std::move(current));
    }
    return out;
}

std::vector<Sequence> build_sequences(std::vector<CaptureRecord>& records,
                                      const config::SequenceConfig& cfg) {
    std::vector<Sequence> sequences;

    for (const auto& group : group_captures(records)) {
        for (auto& members : split_group(records, group, cfg)) {
            Sequence seq;
            seq.id = core::make_uuid4();
            seq.members = std::move(members);
            sequences.push_back(std::move(seq));
        }
    }

    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].ok() && records[i].filetype == FileType::VIDEO) {
            Sequence seq;
            seq.id = core::make_uuid4();
            seq.members = {i};
            sequences.push_back(std::move(seq));
        }
    }

    for (const auto& seq : sequences) {
        for (size_t i : seq.members) {
            records[i].sequence_id = seq.id;
        }
    }

    std::cerr << "[SEQ] Built " << sequences.size() << " sequences" << std::endl;
    return sequences;
}

} // namespace geoseq::sequence
