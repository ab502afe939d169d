#include "geoseq/pipeline/pipeline.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/geo.hpp"
#include "geoseq/core/utils.hpp"
#include "geoseq/description/assembler.hpp"
#include "geoseq/geotag/interpolator.hpp"
#include "geoseq/geotag/source_selector.hpp"
#include "geoseq/io/mp4_reader.hpp"
#include "geoseq/sequence/duplicates.hpp"
#include "geoseq/sequence/limits.hpp"
#include "geoseq/sequence/sequence_builder.hpp"
#include "geoseq/telemetry/gpx_parser.hpp"
#include "geoseq/telemetry/image_exif.hpp"
#include "geoseq/telemetry/nmea_parser.hpp"
#include "geoseq/telemetry/track_filters.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

namespace geoseq::pipeline {

const std::vector<std::string> IMAGE_EXTENSIONS = {".jpg", ".jpeg", ".tif", ".tiff", ".png", ".heic"};
const std::vector<std::string> VIDEO_EXTENSIONS = {".mp4", ".mov", ".360", ".lrv"};

int compute_worker_count(int configured, size_t task_count) {
    int workers = configured;
    const int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (workers < 1) {
        workers = cpu_cores > 0 ? cpu_cores : 1;
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(std::max<size_t>(1, task_count)));
    }
    return std::max(1, workers);
}

CaptureError capture_error_from(const std::exception& e) {
    ErrorKind kind = ErrorKind::UNKNOWN;
    if (dynamic_cast<const ParseError*>(&e)) kind = ErrorKind::PARSE;
    else if (dynamic_cast<const GeotaggingError*>(&e)) kind = ErrorKind::GEOTAGGING;
    else if (dynamic_cast<const OutsideTrackError*>(&e)) kind = ErrorKind::OUTSIDE_TRACK;
    else if (dynamic_cast<const AlignmentError*>(&e)) kind = ErrorKind::ALIGNMENT;
    else if (dynamic_cast<const StationaryVideoError*>(&e)) kind = ErrorKind::STATIONARY_VIDEO;
    else if (dynamic_cast<const GPSNoiseError*>(&e)) kind = ErrorKind::GPS_NOISE;
    else if (dynamic_cast<const NullIslandError*>(&e)) kind = ErrorKind::NULL_ISLAND;
    else if (dynamic_cast<const CaptureSpeedTooFastError*>(&e)) kind = ErrorKind::CAPTURE_SPEED_TOO_FAST;
    else if (dynamic_cast<const MetadataValidationError*>(&e)) kind = ErrorKind::METADATA_VALIDATION;
    else if (dynamic_cast<const IOError*>(&e)) kind = ErrorKind::IO;
    return {kind, e.what()};
}

Pipeline::Pipeline(const config::Config& cfg, runner::EventEmitter& emitter, std::string run_id,
                   io::MetadataReader* metadata_reader, io::ExiftoolRunner* exiftool_runner)
    : cfg_(cfg), emitter_(emitter), run_id_(std::move(run_id)),
      exiftool_runner_(exiftool_runner), metadata_reader_(metadata_reader) {
    if (!exiftool_runner_) {
        if (auto exe = io::find_exiftool(cfg_.exiftool.path)) {
            owned_runner_ = std::make_unique<io::QProcessExiftoolRunner>(*exe, cfg_.exiftool.timeout_sec);
            exiftool_runner_ = owned_runner_.get();
            std::cerr << "[EXIFTOOL] Using " << *exe << std::endl;
        }
    }
    if (!metadata_reader_ && exiftool_runner_) {
        owned_reader_ = std::make_unique<io::ExiftoolMetadataReader>(*exiftool_runner_);
        metadata_reader_ = owned_reader_.get();
    }
}

template <typename Fn>
void Pipeline::for_each_parallel(std::vector<CaptureRecord*>& items, const std::string& label, Fn fn) {
    if (items.empty()) {
        return;
    }
    const int n_workers = compute_worker_count(cfg_.runtime.parallel_workers, items.size());

    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::mutex log_mutex;

    auto worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1);
            if (i >= items.size()) {
                break;
            }
            CaptureRecord& record = *items[i];
            try {
                fn(record);
            } catch (const std::exception& e) {
                record.error = capture_error_from(e);
                std::lock_guard<std::mutex> lock(log_mutex);
                std::cerr << "[GEOTAG] " << record.filename.string() << ": "
                          << error_kind_to_string(record.error->kind) << ": " << e.what() << std::endl;
            }

            const size_t n = done.fetch_add(1) + 1;
            if (n % 10 == 0 || n == items.size()) {
                emitter_.phase_progress(run_id_, phase_to_int(Phase::GEOTAG), phase_to_string(Phase::GEOTAG),
                                        static_cast<int>(n), static_cast<int>(items.size()),
                                        {{"what", label}, {"workers", n_workers}});
            }
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }
}

std::vector<CaptureRecord> Pipeline::discover(const std::vector<fs::path>& inputs) const {
    std::vector<std::string> extensions = IMAGE_EXTENSIONS;
    extensions.insert(extensions.end(), VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end());

    std::vector<CaptureRecord> records;
    for (const auto& path : core::discover_files(inputs, cfg_.runtime.recursive, extensions)) {
        CaptureRecord r;
        r.filename = path;
        const std::string ext = core::to_lower(path.extension().string());
        r.filetype = std::find(VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end(), ext) != VIDEO_EXTENSIONS.end()
                         ? FileType::VIDEO
                         : FileType::IMAGE;
        records.push_back(std::move(r));
    }
    return records;
}

void check_tools(const config::Config& cfg, const std::vector<CaptureRecord>& records,
                 bool have_metadata_reader, bool have_exiftool_runner) {
    const bool has_images = std::any_of(records.begin(), records.end(),
                                        [](const CaptureRecord& r) { return r.filetype == FileType::IMAGE; });
    const bool has_videos = std::any_of(records.begin(), records.end(),
                                        [](const CaptureRecord& r) { return r.filetype == FileType::VIDEO; });

    if (has_images && !have_metadata_reader && cfg.geotag.geotag_source != "exiftool_xml") {
        throw ToolUnavailableError("exiftool is required to read image metadata with geotag_source=" +
                                   cfg.geotag.geotag_source + " but was not found");
    }

    const auto& specs = cfg.geotag.video_geotag_source;
    const bool only_exiftool = !specs.empty() &&
        std::all_of(specs.begin(), specs.end(),
                    [](const SourceSpec& s) { return s.kind == SourceKind::EXIFTOOL_RUNTIME; });
    if (has_videos && only_exiftool && !have_exiftool_runner) {
        throw ToolUnavailableError("exiftool is the only video geotag source but was not found");
    }
}

void Pipeline::check_tools(const std::vector<CaptureRecord>& records) const {
    pipeline::check_tools(cfg_, records, metadata_reader_ != nullptr, exiftool_runner_ != nullptr);
}

void Pipeline::geotag_image(CaptureRecord& record, const std::vector<io::MetadataRecord>* xml_records) {
    io::MetadataRecord meta;
    if (xml_records) {
        const io::MetadataRecord* found = io::find_record_for(*xml_records, record.filename);
        if (!found) {
            throw GeotaggingError("No entry for " + record.filename.filename().string() + " in " +
                                  cfg_.geotag.geotag_source_path);
        }
        meta = *found;
    } else {
        if (!metadata_reader_) {
            throw GeotaggingError("exiftool is not available");
        }
        meta = metadata_reader_->read(record.filename);
    }

    const telemetry::ImageExif exif = telemetry::parse_image_exif(meta);
    record.make = exif.make;
    record.model = exif.model;
    record.orientation = exif.orientation;
    record.gps_accuracy = exif.gps_accuracy;
    record.width = exif.width;
    record.height = exif.height;
    record.angle = exif.angle;

    if (!exif.time) {
        throw GeotaggingError("Unable to extract capture time from " + record.filename.filename().string());
    }
    record.raw_time = *exif.time;
    record.time = record.raw_time;

    const std::string& source = cfg_.geotag.geotag_source;
    if (source == "gpx" || source == "nmea") {
        return;
    }
    if (!exif.lat || !exif.lon) {
        throw GeotaggingError("Unable to extract GPS location from " + record.filename.filename().string());
    }
    record.lat = *exif.lat;
    record.lon = *exif.lon;
    record.alt = exif.alt;
}

void Pipeline::geotag_images_from_track(std::vector<CaptureRecord>& records) {
    std::vector<CaptureRecord*> images;
    for (auto& r : records) {
        if (r.ok() && r.filetype == FileType::IMAGE) {
            images.push_back(&r);
        }
    }
    if (images.empty()) {
        return;
    }

    const fs::path track_path = cfg_.geotag.geotag_source_path;
    Track track;
    try {
        track = cfg_.geotag.geotag_source == "gpx" ? telemetry::parse_gpx_file(track_path)
                                                   : telemetry::parse_nmea_file(track_path);
    } catch (const GeoseqError& e) {
        const CaptureError err{ErrorKind::GEOTAGGING,
                               "Failed to read " + track_path.string() + ": " + e.what()};
        for (auto* r : images) {
            r->error = err;
        }
        emitter_.warning(run_id_, err.message);
        return;
    }

    track = telemetry::normalize_track(std::move(track));
    geotag::geotag_from_track(images, track, cfg_.interpolation);
}

void Pipeline::geotag_video(CaptureRecord& record) {
    geotag::SourceSelector selector(exiftool_runner_);
    geotag::SelectedTrack selected = selector.select(record.filename, cfg_.geotag.video_geotag_source);

    Track track = telemetry::normalize_track(std::move(selected.telemetry.points));
    if (cfg_.video.filter_noisy_points) {
        track = telemetry::remove_noisy_points(track, cfg_.video);
    }
    if (track.empty()) {
        throw GPSNoiseError("No GPS points left after noise filtering");
    }
    if (telemetry::is_stationary(track, cfg_.video.stationary_radius_m)) {
        throw StationaryVideoError("Stationary video: all GPS points are within " +
                                   std::to_string(cfg_.video.stationary_radius_m) + " m of the first");
    }
    sequence::check_track_limits(track, cfg_.sequence);

    record.make = selected.telemetry.make;
    record.model = selected.telemetry.model;

    if (selected.source == SourceKind::GPX || selected.source == SourceKind::NMEA) {
        double start = track.front().time;
        try {
            io::Mp4Reader reader(record.filename);
            if (reader.movie().creation_time) {
                start = *reader.movie().creation_time;
            }
        } catch (const ParseError& e) {
            std::cerr << "[GEOTAG] " << record.filename.filename().string()
                      << ": no container creation time, using track start: " << e.what() << std::endl;
        }
        record.raw_time = start;
        std::vector<CaptureRecord*> one{&record};
        geotag::geotag_from_track(one, track, cfg_.interpolation);
        if (record.error) {
            return;
        }
    } else {
        const GPSPoint& first = track.front();
        record.raw_time = first.time;
        record.time = first.time;
        record.lat = first.lat;
        record.lon = first.lon;
        record.alt = first.alt;
        if (first.angle) {
            record.angle = core::normalize_bearing(*first.angle);
        }
    }

    if (!record.angle) {
        for (const auto& p : track) {
            if (core::haversine_distance(record.lat, record.lon, p.lat, p.lon) > 0.0) {
                record.angle = core::compute_bearing(record.lat, record.lon, p.lat, p.lon);
                break;
            }
        }
    }
}

void Pipeline::geotag(std::vector<CaptureRecord>& records) {
    std::vector<CaptureRecord*> images;
    std::vector<CaptureRecord*> videos;
    for (auto& r : records) {
        (r.filetype == FileType::IMAGE ? images : videos).push_back(&r);
    }

    const std::string& source = cfg_.geotag.geotag_source;
    std::vector<io::MetadataRecord> xml_records;
    const std::vector<io::MetadataRecord>* xml = nullptr;
    bool images_ready = true;
    if (!images.empty() && source == "exiftool_xml") {
        try {
            xml_records = io::parse_exiftool_xml(core::read_text(cfg_.geotag.geotag_source_path));
            xml = &xml_records;
        } catch (const GeoseqError& e) {
            images_ready = false;
            for (auto* r : images) {
                r->error = CaptureError{ErrorKind::GEOTAGGING, e.what()};
            }
            emitter_.warning(run_id_, e.what());
        }
    }

    if (images_ready) {
        for_each_parallel(images, "images", [this, xml](CaptureRecord& r) { geotag_image(r, xml); });
    }
    if (source == "gpx" || source == "nmea") {
        geotag_images_from_track(records);
    }

    for_each_parallel(videos, "videos", [this](CaptureRecord& r) { geotag_video(r); });
}

std::vector<Sequence> Pipeline::build_sequences(std::vector<CaptureRecord>& records, size_t* duplicates) const {
    std::vector<Sequence> sequences = sequence::build_sequences(records, cfg_.sequence);
    const size_t dups = sequence::mark_duplicates(records, sequences, cfg_.sequence);
    sequence::assign_directions(records, sequences, cfg_.sequence);
    sequence::apply_sequence_limits(records, sequences, cfg_.sequence);
    if (duplicates) {
        *duplicates = dups;
    }
    return sequences;
}

PipelineResult Pipeline::run(const std::vector<fs::path>& inputs) {
    PipelineResult result;

    emitter_.phase_start(run_id_, phase_to_int(Phase::DISCOVER), phase_to_string(Phase::DISCOVER));
    result.records = discover(inputs);
    const size_t n_videos = static_cast<size_t>(std::count_if(
        result.records.begin(), result.records.end(),
        [](const CaptureRecord& r) { return r.filetype == FileType::VIDEO; }));
    emitter_.phase_end(run_id_, phase_to_int(Phase::DISCOVER), phase_to_string(Phase::DISCOVER), "ok",
                       {{"images", result.records.size() - n_videos}, {"videos", n_videos}});

    geotag::check_source_patterns(cfg_.geotag.video_geotag_source, n_videos);
    check_tools(result.records);

    emitter_.phase_start(run_id_, phase_to_int(Phase::GEOTAG), phase_to_string(Phase::GEOTAG));
    geotag(result.records);
    const size_t geotag_failed = static_cast<size_t>(std::count_if(
        result.records.begin(), result.records.end(), [](const CaptureRecord& r) { return !r.ok(); }));
    emitter_.phase_end(run_id_, phase_to_int(Phase::GEOTAG), phase_to_string(Phase::GEOTAG), "ok",
                       {{"geotagged", result.records.size() - geotag_failed}, {"failed", geotag_failed}});

    emitter_.phase_start(run_id_, phase_to_int(Phase::SEQUENCE), phase_to_string(Phase::SEQUENCE));
    result.sequences = build_sequences(result.records, &result.duplicate_count);
    emitter_.phase_end(run_id_, phase_to_int(Phase::SEQUENCE), phase_to_string(Phase::SEQUENCE), "ok",
                       {{"sequences", result.sequences.size()}, {"duplicates", result.duplicate_count}});

    emitter_.phase_start(run_id_, phase_to_int(Phase::ASSEMBLE), phase_to_string(Phase::ASSEMBLE));
    result.descriptions = description::assemble_descriptions(result.records);
    for (const auto& desc : result.descriptions) {
        if (description::is_error_description(desc)) {
            ++result.error_count;
            emitter_.file_error(run_id_, desc["filename"].get<std::string>(),
                                desc["error"]["type"].get<std::string>(),
                                desc["error"]["message"].get<std::string>());
        }
    }
    emitter_.phase_end(run_id_, phase_to_int(Phase::ASSEMBLE), phase_to_string(Phase::ASSEMBLE), "ok",
                       {{"descriptions", result.descriptions.size()}, {"errors", result.error_count}});
    return result;
}

} // namespace geoseq::pipeline
