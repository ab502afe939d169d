#pragma once

#include "geoseq/config/configuration.hpp"
#include "geoseq/core/types.hpp"
#include "geoseq/io/exiftool.hpp"
#include "geoseq/io/metadata_record.hpp"
#include "geoseq/runner/events.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace geoseq::pipeline {

extern const std::vector<std::string> IMAGE_EXTENSIONS;
extern const std::vector<std::string> VIDEO_EXTENSIONS;

// min(configured or hardware concurrency, task count), at least 1
int compute_worker_count(int configured, size_t task_count);

// Throws ToolUnavailableError when the sources needed by the discovered files all depend on
// exiftool and it was not found
void check_tools(const config::Config& cfg, const std::vector<CaptureRecord>& records,
                 bool have_metadata_reader, bool have_exiftool_runner);

// Maps a caught exception onto the per-file error kinds
CaptureError capture_error_from(const std::exception& e);

struct PipelineResult {
    std::vector<CaptureRecord> records;
    std::vector<Sequence> sequences;
    nlohmann::json descriptions = nlohmann::json::array();
    size_t error_count = 0;
    size_t duplicate_count = 0;
};

/**
 * Batch geotagging run: discovery, per-file geotagging on a worker pool,
 * then sequence building, duplicate detection, direction derivation and
 * sequence limits on the joined set, then description assembly.
 *
 * The metadata reader and exiftool runner default to exiftool found via
 * GEOSEQ_EXIFTOOL_PATH, exiftool.path or PATH; tests inject fakes.
 */
class Pipeline {
public:
    Pipeline(const config::Config& cfg, runner::EventEmitter& emitter, std::string run_id,
             io::MetadataReader* metadata_reader = nullptr,
             io::ExiftoolRunner* exiftool_runner = nullptr);

    PipelineResult run(const std::vector<fs::path>& inputs);

    std::vector<CaptureRecord> discover(const std::vector<fs::path>& inputs) const;
    void geotag(std::vector<CaptureRecord>& records);
    std::vector<Sequence> build_sequences(std::vector<CaptureRecord>& records, size_t* duplicates = nullptr) const;

    void check_tools(const std::vector<CaptureRecord>& records) const;

private:
    const config::Config& cfg_;
    runner::EventEmitter& emitter_;
    std::string run_id_;

    std::unique_ptr<io::ExiftoolRunner> owned_runner_;
    std::unique_ptr<io::MetadataReader> owned_reader_;
    io::ExiftoolRunner* exiftool_runner_;
    io::MetadataReader* metadata_reader_;

    void geotag_image(CaptureRecord& record, const std::vector<io::MetadataRecord>* xml_records);
    void geotag_video(CaptureRecord& record);
    void geotag_images_from_track(std::vector<CaptureRecord>& records);

    template <typename Fn>
    void for_each_parallel(std::vector<CaptureRecord*>& items, const std::string& label, Fn fn);
};

} // namespace geoseq::pipeline
