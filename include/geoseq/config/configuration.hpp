#pragma once

#include "geoseq/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace geoseq::config {

namespace fs = std::filesystem;

struct GeotagConfig {
  std::string geotag_source = "exif"; // exif | gpx | nmea | exiftool_xml | exiftool_runtime
  std::string geotag_source_path;
  std::vector<SourceSpec> video_geotag_source = {
      {SourceKind::VIDEO, ""},
      {SourceKind::EXIFTOOL_RUNTIME, ""},
  };
};

struct InterpolationConfig {
  double offset_time = 0.0;
  bool use_gpx_start_time = false;
  double extrapolation_tolerance = 0.001; // seconds
};

struct SequenceConfig {
  double cutoff_distance = 600.0;   // meters
  double cutoff_time = 60.0;        // seconds
  double duplicate_distance = 0.1;  // meters
  double duplicate_angle = 5.0;     // degrees, 360 disables the angle check
  double offset_angle = 0.0;
  bool interpolate_directions = false;
  int max_sequence_length = 500;
  double max_capture_speed_kmh = 400.0;
};

struct VideoConfig {
  double stationary_radius_m = 10.0;
  bool filter_noisy_points = true;
  double max_dop100 = 1000.0;
  std::vector<int> gps_fixes = {2, 3};
  double gps_precision_m = 15.0;
};

struct ExiftoolConfig {
  std::string path; // empty = search PATH
  int timeout_sec = 60;
};

struct RuntimeConfig {
  int parallel_workers = 0; // 0 = hardware concurrency
  bool recursive = true;
};

struct OutputConfig {
  std::string description_file = "geoseq_image_description.json";
};

struct Config {
  GeotagConfig geotag;
  InterpolationConfig interpolation;
  SequenceConfig sequence;
  VideoConfig video;
  ExiftoolConfig exiftool;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

// Parses "source" or "source:pattern" as given on the command line
SourceSpec parse_source_spec(const std::string &text);

std::string get_schema_json();

} // namespace geoseq::config
