#include "geoseq/config/configuration.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/utils.hpp"
#include "geoseq/description/assembler.hpp"
#include "geoseq/pipeline/pipeline.hpp"
#include "geoseq/runner/events.hpp"

#include <CLI/CLI.hpp>
#include <QCoreApplication>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_FILE_ERRORS = 2;

struct Overrides {
  CLI::Option *geotag_source = nullptr;
  CLI::Option *geotag_source_path = nullptr;
  CLI::Option *video_sources = nullptr;
  CLI::Option *offset_time = nullptr;
  CLI::Option *offset_angle = nullptr;
  CLI::Option *workers = nullptr;

  std::string geotag_source_value;
  std::string geotag_source_path_value;
  std::vector<std::string> video_source_values;
  double offset_time_value = 0.0;
  double offset_angle_value = 0.0;
  int workers_value = 0;
  bool use_gpx_start_time = false;
  bool interpolate_directions = false;
};

void apply_overrides(geoseq::config::Config &cfg, const Overrides &o) {
  if (o.geotag_source->count() > 0) {
    cfg.geotag.geotag_source = o.geotag_source_value;
  }
  if (o.geotag_source_path->count() > 0) {
    cfg.geotag.geotag_source_path = o.geotag_source_path_value;
  }
  if (o.video_sources->count() > 0) {
    cfg.geotag.video_geotag_source.clear();
    for (const auto &text : o.video_source_values) {
      cfg.geotag.video_geotag_source.push_back(
          geoseq::config::parse_source_spec(text));
    }
  }
  if (o.offset_time->count() > 0) {
    cfg.interpolation.offset_time = o.offset_time_value;
  }
  if (o.use_gpx_start_time) {
    cfg.interpolation.use_gpx_start_time = true;
  }
  if (o.interpolate_directions) {
    cfg.sequence.interpolate_directions = true;
  }
  if (o.offset_angle->count() > 0) {
    cfg.sequence.offset_angle = o.offset_angle_value;
  }
  if (o.workers->count() > 0) {
    cfg.runtime.parallel_workers = o.workers_value;
  }
}

// Next to the first input directory unless given explicitly
fs::path resolve_output_path(const std::string &output,
                             const std::vector<std::string> &inputs,
                             const geoseq::config::Config &cfg) {
  if (!output.empty()) {
    return output;
  }
  const fs::path name = cfg.output.description_file;
  if (name.is_absolute()) {
    return name;
  }
  if (!inputs.empty()) {
    fs::path first(inputs.front());
    if (fs::is_directory(first)) {
      return first / name;
    }
    return first.parent_path() / name;
  }
  return name;
}

int process_command(const std::vector<std::string> &inputs,
                    const std::string &config_path,
                    const std::string &output, const std::string &log_path,
                    const Overrides &overrides) {
  std::ofstream log_file;
  if (!log_path.empty()) {
    log_file.open(log_path, std::ios::app);
    if (!log_file) {
      std::cerr << "Error: cannot open log file " << log_path << std::endl;
      return EXIT_FATAL;
    }
  }

  geoseq::runner::EventEmitter emitter(log_file.is_open() ? &log_file : nullptr);
  const std::string run_id = geoseq::core::get_run_id();

  geoseq::config::Config cfg;
  try {
    if (!config_path.empty()) {
      cfg = geoseq::config::Config::load(config_path);
    }
    apply_overrides(cfg, overrides);
    cfg.validate();
  } catch (const geoseq::GeoseqError &e) {
    emitter.run_error(run_id, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FATAL;
  }

  json start;
  start["inputs"] = inputs;
  start["geotag_source"] = cfg.geotag.geotag_source;
  json video_sources = json::array();
  for (const auto &spec : cfg.geotag.video_geotag_source) {
    video_sources.push_back({{"source", geoseq::source_kind_to_string(spec.kind)},
                             {"pattern", spec.effective_pattern()}});
  }
  start["video_geotag_source"] = video_sources;
  start["config_path"] = config_path;
  emitter.run_start(run_id, start);

  try {
    std::vector<fs::path> paths(inputs.begin(), inputs.end());
    geoseq::pipeline::Pipeline pipeline(cfg, emitter, run_id);
    auto result = pipeline.run(paths);

    const fs::path out_path = resolve_output_path(output, inputs, cfg);
    geoseq::description::write_descriptions(out_path, result.descriptions);

    const bool success = result.error_count == 0;
    emitter.run_end(run_id, success,
                    {{"status", success ? "ok" : "partial"},
                     {"output", out_path.string()},
                     {"files", result.records.size()},
                     {"errors", result.error_count},
                     {"duplicates", result.duplicate_count},
                     {"sequences", result.sequences.size()}});
    return success ? EXIT_OK : EXIT_FILE_ERRORS;
  } catch (const geoseq::GeoseqError &e) {
    emitter.run_error(run_id, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FATAL;
  }
}

int validate_config_command(const std::string &config_path) {
  json result;
  result["valid"] = false;
  result["path"] = config_path;
  result["errors"] = json::array();

  try {
    auto cfg = geoseq::config::Config::load(config_path);
    cfg.validate();
    result["valid"] = true;
  } catch (const geoseq::GeoseqError &e) {
    result["errors"].push_back(e.what());
  }

  std::cout << result.dump(2) << std::endl;
  return result["valid"].get<bool>() ? EXIT_OK : EXIT_FATAL;
}

} // namespace

int main(int argc, char *argv[]) {
  QCoreApplication qapp(argc, argv); // QProcess needs an application instance

  CLI::App app{"geoseq - geotagging and sequence construction for images and videos"};
  app.require_subcommand(1);

  std::vector<std::string> inputs;
  std::string config_path, output, log_path;
  Overrides overrides;

  auto process_cmd = app.add_subcommand("process", "Geotag media files and write the description JSON");
  process_cmd->add_option("paths", inputs, "Image/video files or directories")->required();
  process_cmd->add_option("--config", config_path, "Path to config.yaml");
  process_cmd->add_option("--output", output, "Description JSON output path");
  process_cmd->add_option("--log-file", log_path, "Append events to this file");
  overrides.geotag_source = process_cmd->add_option(
      "--geotag-source", overrides.geotag_source_value,
      "exif | gpx | nmea | exiftool_xml | exiftool_runtime");
  overrides.geotag_source_path = process_cmd->add_option(
      "--geotag-source-path", overrides.geotag_source_path_value,
      "GPX/NMEA/exiftool XML file for images");
  overrides.video_sources = process_cmd->add_option(
      "--video-geotag-source", overrides.video_source_values,
      "Video source as source[:pattern]; repeatable, tried in order");
  overrides.offset_time = process_cmd->add_option(
      "--interpolation-offset-time", overrides.offset_time_value,
      "Seconds added to capture times before interpolation");
  process_cmd->add_flag("--interpolation-use-gpx-start-time", overrides.use_gpx_start_time,
                        "Align the earliest capture with the track start");
  process_cmd->add_flag("--interpolate-directions", overrides.interpolate_directions,
                        "Recompute headings from capture positions");
  overrides.offset_angle = process_cmd->add_option(
      "--offset-angle", overrides.offset_angle_value, "Degrees added to derived headings");
  overrides.workers = process_cmd->add_option(
      "--workers", overrides.workers_value, "Parallel workers (0 = hardware concurrency)");

  std::string validate_path;
  auto validate_cmd = app.add_subcommand("validate-config", "Validate a config file");
  validate_cmd->add_option("--config", validate_path, "Path to config.yaml")->required();

  auto schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

  CLI11_PARSE(app, argc, argv);

  if (process_cmd->parsed()) {
    return process_command(inputs, config_path, output, log_path, overrides);
  }
  if (validate_cmd->parsed()) {
    return validate_config_command(validate_path);
  }
  if (schema_cmd->parsed()) {
    std::cout << geoseq::config::get_schema_json() << std::endl;
    return EXIT_OK;
  }

  std::cerr << app.help() << std::endl;
  return EXIT_FATAL;
}
