#include "geoseq/config/configuration.hpp"
#include "geoseq/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace geoseq::config {

static SourceKind read_source_kind(const std::string& name) {
    auto kind = string_to_source_kind(name);
    if (!kind) {
        throw ConfigError("Unknown geotag source: " + name);
    }
    return *kind;
}

static std::vector<SourceSpec> read_source_list(const YAML::Node& n) {
    std::vector<SourceSpec> out;
    if (!n.IsSequence()) {
        throw ConfigError("geotag.video_geotag_source must be a list");
    }
    for (const auto& item : n) {
        SourceSpec spec;
        if (item.IsScalar()) {
            spec.kind = read_source_kind(item.as<std::string>());
        } else if (item.IsMap()) {
            if (!item["source"]) {
                throw ConfigError("geotag.video_geotag_source entry needs a 'source' key");
            }
            spec.kind = read_source_kind(item["source"].as<std::string>());
            if (item["pattern"]) spec.pattern = item["pattern"].as<std::string>();
        } else {
            throw ConfigError("geotag.video_geotag_source entries must be strings or maps");
        }
        out.push_back(spec);
    }
    return out;
}

SourceSpec parse_source_spec(const std::string& text) {
    SourceSpec spec;
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        spec.kind = read_source_kind(text);
    } else {
        spec.kind = read_source_kind(text.substr(0, colon));
        spec.pattern = text.substr(colon + 1);
    }
    return spec;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse config file " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["geotag"]) {
            auto g = node["geotag"];
            if (g["geotag_source"]) cfg.geotag.geotag_source = g["geotag_source"].as<std::string>();
            if (g["geotag_source_path"]) cfg.geotag.geotag_source_path = g["geotag_source_path"].as<std::string>();
            if (g["video_geotag_source"]) cfg.geotag.video_geotag_source = read_source_list(g["video_geotag_source"]);
        }

        if (node["interpolation"]) {
            auto i = node["interpolation"];
            if (i["offset_time"]) cfg.interpolation.offset_time = i["offset_time"].as<double>();
            if (i["use_gpx_start_time"]) cfg.interpolation.use_gpx_start_time = i["use_gpx_start_time"].as<bool>();
            if (i["extrapolation_tolerance"]) cfg.interpolation.extrapolation_tolerance = i["extrapolation_tolerance"].as<double>();
        }

        if (node["sequence"]) {
            auto s = node["sequence"];
            if (s["cutoff_distance"]) cfg.sequence.cutoff_distance = s["cutoff_distance"].as<double>();
            if (s["cutoff_time"]) cfg.sequence.cutoff_time = s["cutoff_time"].as<double>();
            if (s["duplicate_distance"]) cfg.sequence.duplicate_distance = s["duplicate_distance"].as<double>();
            if (s["duplicate_angle"]) cfg.sequence.duplicate_angle = s["duplicate_angle"].as<double>();
            if (s["offset_angle"]) cfg.sequence.offset_angle = s["offset_angle"].as<double>();
            if (s["interpolate_directions"]) cfg.sequence.interpolate_directions = s["interpolate_directions"].as<bool>();
            if (s["max_sequence_length"]) cfg.sequence.max_sequence_length = s["max_sequence_length"].as<int>();
            if (s["max_capture_speed_kmh"]) cfg.sequence.max_capture_speed_kmh = s["max_capture_speed_kmh"].as<double>();
        }

        if (node["video"]) {
            auto v = node["video"];
            if (v["stationary_radius_m"]) cfg.video.stationary_radius_m = v["stationary_radius_m"].as<double>();
            if (v["filter_noisy_points"]) cfg.video.filter_noisy_points = v["filter_noisy_points"].as<bool>();
            if (v["max_dop100"]) cfg.video.max_dop100 = v["max_dop100"].as<double>();
            if (v["gps_fixes"]) cfg.video.gps_fixes = v["gps_fixes"].as<std::vector<int>>();
            if (v["gps_precision_m"]) cfg.video.gps_precision_m = v["gps_precision_m"].as<double>();
        }

        if (node["exiftool"]) {
            auto e = node["exiftool"];
            if (e["path"]) cfg.exiftool.path = e["path"].as<std::string>();
            if (e["timeout_sec"]) cfg.exiftool.timeout_sec = e["timeout_sec"].as<int>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
            if (r["recursive"]) cfg.runtime.recursive = r["recursive"].as<bool>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["description_file"]) cfg.output.description_file = o["description_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["geotag"]["geotag_source"] = geotag.geotag_source;
    node["geotag"]["geotag_source_path"] = geotag.geotag_source_path;
    YAML::Node sources(YAML::NodeType::Sequence);
    for (const auto& spec : geotag.video_geotag_source) {
        YAML::Node entry;
        entry["source"] = source_kind_to_string(spec.kind);
        if (!spec.pattern.empty()) entry["pattern"] = spec.pattern;
        sources.push_back(entry);
    }
    node["geotag"]["video_geotag_source"] = sources;

    node["interpolation"]["offset_time"] = interpolation.offset_time;
    node["interpolation"]["use_gpx_start_time"] = interpolation.use_gpx_start_time;
    node["interpolation"]["extrapolation_tolerance"] = interpolation.extrapolation_tolerance;

    node["sequence"]["cutoff_distance"] = sequence.cutoff_distance;
    node["sequence"]["cutoff_time"] = sequence.cutoff_time;
    node["sequence"]["duplicate_distance"] = sequence.duplicate_distance;
    node["sequence"]["duplicate_angle"] = sequence.duplicate_angle;
    node["sequence"]["offset_angle"] = sequence.offset_angle;
    node["sequence"]["interpolate_directions"] = sequence.interpolate_directions;
    node["sequence"]["max_sequence_length"] = sequence.max_sequence_length;
    node["sequence"]["max_capture_speed_kmh"] = sequence.max_capture_speed_kmh;

    node["video"]["stationary_radius_m"] = video.stationary_radius_m;
    node["video"]["filter_noisy_points"] = video.filter_noisy_points;
    node["video"]["max_dop100"] = video.max_dop100;
    node["video"]["gps_fixes"] = video.gps_fixes;
    node["video"]["gps_precision_m"] = video.gps_precision_m;

    node["exiftool"]["path"] = exiftool.path;
    node["exiftool"]["timeout_sec"] = exiftool.timeout_sec;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["recursive"] = runtime.recursive;

    node["output"]["description_file"] = output.description_file;

    return node;
}

void Config::validate() const {
    auto image_source = string_to_source_kind(geotag.geotag_source);
    if (!image_source ||
        (*image_source != SourceKind::EXIF && *image_source != SourceKind::GPX &&
         *image_source != SourceKind::NMEA && *image_source != SourceKind::EXIFTOOL_XML &&
         *image_source != SourceKind::EXIFTOOL_RUNTIME)) {
        throw ValidationError("geotag.geotag_source must be one of exif, gpx, nmea, exiftool_xml, exiftool_runtime");
    }
    if ((*image_source == SourceKind::GPX || *image_source == SourceKind::NMEA ||
         *image_source == SourceKind::EXIFTOOL_XML) && geotag.geotag_source_path.empty()) {
        throw ValidationError("geotag.geotag_source_path is required for geotag_source '" +
                              geotag.geotag_source + "'");
    }
    if (geotag.video_geotag_source.empty()) {
        throw ValidationError("geotag.video_geotag_source must not be empty");
    }
    for (const auto& spec : geotag.video_geotag_source) {
        if (spec.kind == SourceKind::EXIF) {
            throw ValidationError("geotag.video_geotag_source does not accept 'exif'");
        }
    }

    if (!std::isfinite(interpolation.offset_time)) {
        throw ValidationError("interpolation.offset_time must be finite");
    }
    if (interpolation.extrapolation_tolerance < 0.0) {
        throw ValidationError("interpolation.extrapolation_tolerance must be >= 0");
    }

    if (sequence.cutoff_distance <= 0.0) {
        throw ValidationError("sequence.cutoff_distance must be > 0");
    }
    if (sequence.cutoff_time <= 0.0) {
        throw ValidationError("sequence.cutoff_time must be > 0");
    }
    if (sequence.duplicate_distance < 0.0) {
        throw ValidationError("sequence.duplicate_distance must be >= 0");
    }
    if (sequence.duplicate_angle < 0.0 || sequence.duplicate_angle > 360.0) {
        throw ValidationError("sequence.duplicate_angle must be in [0, 360]");
    }
    if (sequence.max_sequence_length < 1 || sequence.max_sequence_length > 500) {
        throw ValidationError("sequence.max_sequence_length must be in [1, 500]");
    }
    if (sequence.max_capture_speed_kmh <= 0.0) {
        throw ValidationError("sequence.max_capture_speed_kmh must be > 0");
    }

    if (video.stationary_radius_m < 0.0) {
        throw ValidationError("video.stationary_radius_m must be >= 0");
    }
    if (video.max_dop100 <= 0.0) {
        throw ValidationError("video.max_dop100 must be > 0");
    }
    for (int fix : video.gps_fixes) {
        if (fix != 0 && fix != 2 && fix != 3) {
            throw ValidationError("video.gps_fixes entries must be 0, 2 or 3");
        }
    }

    if (exiftool.timeout_sec < 1) {
        throw ValidationError("exiftool.timeout_sec must be >= 1");
    }
    if (runtime.parallel_workers < 0) {
        throw ValidationError("runtime.parallel_workers must be >= 0");
    }
    if (output.description_file.empty()) {
        throw ValidationError("output.description_file must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "geotag": {
      "type": "object",
      "properties": {
        "geotag_source": {"type": "string", "enum": ["exif", "gpx", "nmea", "exiftool_xml", "exiftool_runtime"]},
        "geotag_source_path": {"type": "string"},
        "video_geotag_source": {
          "type": "array",
          "items": {
            "type": "object",
            "properties": {
              "source": {"type": "string", "enum": ["video", "camm", "gopro", "blackvue", "gpx", "nmea", "exiftool_xml", "exiftool_runtime"]},
              "pattern": {"type": "string"}
            },
            "required": ["source"]
          }
        }
      }
    },
    "interpolation": {
      "type": "object",
      "properties": {
        "offset_time": {"type": "number"},
        "use_gpx_start_time": {"type": "boolean"},
        "extrapolation_tolerance": {"type": "number", "minimum": 0}
      }
    },
    "sequence": {
      "type": "object",
      "properties": {
        "cutoff_distance": {"type": "number", "exclusiveMinimum": 0},
        "cutoff_time": {"type": "number", "exclusiveMinimum": 0},
        "duplicate_distance": {"type": "number", "minimum": 0},
        "duplicate_angle": {"type": "number", "minimum": 0, "maximum": 360},
        "offset_angle": {"type": "number"},
        "interpolate_directions": {"type": "boolean"},
        "max_sequence_length": {"type": "integer", "minimum": 1, "maximum": 500},
        "max_capture_speed_kmh": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "video": {
      "type": "object",
      "properties": {
        "stationary_radius_m": {"type": "number", "minimum": 0},
        "filter_noisy_points": {"type": "boolean"},
        "max_dop100": {"type": "number", "exclusiveMinimum": 0},
        "gps_fixes": {"type": "array", "items": {"type": "integer", "enum": [0, 2, 3]}},
        "gps_precision_m": {"type": "number", "minimum": 0}
      }
    },
    "exiftool": {
      "type": "object",
      "properties": {
        "path": {"type": "string"},
        "timeout_sec": {"type": "integer", "minimum": 1}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 0},
        "recursive": {"type": "boolean"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "description_file": {"type": "string"}
      }
    }
  }
})";
}

} // namespace geoseq::config
