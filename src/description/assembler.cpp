#include "geoseq/description/assembler.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/utils.hpp"

#include <cmath>
#include <iostream>
#include <set>

namespace geoseq::description {

namespace {

double round_to(double v, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(v * scale) / scale;
}

void require_number(const nlohmann::json& desc, const char* key, double lo, double hi) {
    if (!desc.contains(key)) {
        throw MetadataValidationError(std::string("'") + key + "' is a required property");
    }
    const auto& v = desc[key];
    if (!v.is_number()) {
        throw MetadataValidationError(std::string("'") + key + "' is not of type 'number'");
    }
    const double d = v.get<double>();
    if (!std::isfinite(d) || d < lo || d > hi) {
        throw MetadataValidationError(std::string("'") + key + "' value " + v.dump() +
                                      " is out of range [" + std::to_string(lo) + ", " +
                                      std::to_string(hi) + "]");
    }
}

const std::set<std::string>& allowed_keys() {
    static const std::set<std::string> keys = {
        "MAPLatitude", "MAPLongitude", "MAPCaptureTime", "filename", "MAPAltitude",
        "MAPCompassHeading", "MAPSequenceUUID", "MAPOrientation", "MAPDeviceMake",
        "MAPDeviceModel", "MAPGPSAccuracyMeters", "MAPMetaTags"};
    return keys;
}

} // namespace

nlohmann::json describe_capture(const CaptureRecord& record) {
    nlohmann::json desc;
    desc["filename"] = record.filename.string();
    desc["MAPLatitude"] = round_to(record.lat, 7);
    desc["MAPLongitude"] = round_to(record.lon, 7);
    desc["MAPCaptureTime"] = core::format_capture_time(record.time);

    if (record.alt) {
        desc["MAPAltitude"] = round_to(*record.alt, 3);
    }
    if (record.angle) {
        const double heading = round_to(*record.angle, 3);
        desc["MAPCompassHeading"] = {{"TrueHeading", heading}, {"MagneticHeading", heading}};
    }
    if (!record.sequence_id.empty()) {
        desc["MAPSequenceUUID"] = record.sequence_id;
    }
    if (record.orientation) {
        desc["MAPOrientation"] = *record.orientation;
    }
    if (!record.make.empty()) {
        desc["MAPDeviceMake"] = record.make;
    }
    if (!record.model.empty()) {
        desc["MAPDeviceModel"] = record.model;
    }
    if (record.gps_accuracy) {
        desc["MAPGPSAccuracyMeters"] = *record.gps_accuracy;
    }
    if (record.is_duplicate) {
        desc["MAPMetaTags"] = {{"is_duplicate", true}};
    }
    return desc;
}

nlohmann::json describe_error(const fs::path& filename, const std::string& type, const std::string& message) {
    return {
        {"error", {{"type", type}, {"message", message}}},
        {"filename", filename.string()},
    };
}

bool is_error_description(const nlohmann::json& desc) {
    return desc.is_object() && desc.contains("error");
}

void validate_description(const nlohmann::json& desc) {
    if (!desc.is_object()) {
        throw MetadataValidationError("Description is not an object");
    }

    for (auto it = desc.begin(); it != desc.end(); ++it) {
        if (allowed_keys().count(it.key()) == 0) {
            throw MetadataValidationError("Additional property '" + it.key() + "' is not allowed");
        }
    }

    require_number(desc, "MAPLatitude", -90.0, 90.0);
    require_number(desc, "MAPLongitude", -180.0, 180.0);

    if (!desc.contains("filename") || !desc["filename"].is_string()) {
        throw MetadataValidationError("'filename' is a required string");
    }
    if (!desc.contains("MAPCaptureTime") || !desc["MAPCaptureTime"].is_string() ||
        !core::parse_capture_time(desc["MAPCaptureTime"].get<std::string>())) {
        throw MetadataValidationError("'MAPCaptureTime' must match YYYY_MM_DD_HH_MM_SS_mmm");
    }

    if (desc.contains("MAPAltitude")) {
        require_number(desc, "MAPAltitude", -1e7, 1e7);
    }
    if (desc.contains("MAPGPSAccuracyMeters")) {
        require_number(desc, "MAPGPSAccuracyMeters", 0.0, 1e9);
    }
    if (desc.contains("MAPCompassHeading")) {
        const auto& h = desc["MAPCompassHeading"];
        if (!h.is_object()) {
            throw MetadataValidationError("'MAPCompassHeading' is not of type 'object'");
        }
        require_number(h, "TrueHeading", 0.0, 360.0);
        require_number(h, "MagneticHeading", 0.0, 360.0);
        if (h.size() != 2) {
            throw MetadataValidationError("'MAPCompassHeading' has additional properties");
        }
    }
    if (desc.contains("MAPOrientation") && !desc["MAPOrientation"].is_number_integer()) {
        throw MetadataValidationError("'MAPOrientation' is not of type 'integer'");
    }
    for (const char* key : {"MAPSequenceUUID", "MAPDeviceMake", "MAPDeviceModel"}) {
        if (desc.contains(key) && !desc[key].is_string()) {
            throw MetadataValidationError(std::string("'") + key + "' is not of type 'string'");
        }
    }
    if (desc.contains("MAPMetaTags") && !desc["MAPMetaTags"].is_object()) {
        throw MetadataValidationError("'MAPMetaTags' is not of type 'object'");
    }
}

nlohmann::json assemble_descriptions(const std::vector<CaptureRecord>& records) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : records) {
        if (r.error) {
            out.push_back(describe_error(r.filename, error_kind_to_string(r.error->kind), r.error->message));
            continue;
        }
        nlohmann::json desc = describe_capture(r);
        try {
            validate_description(desc);
            out.push_back(std::move(desc));
        } catch (const MetadataValidationError& e) {
            std::cerr << "[DESC] " << r.filename.string() << ": " << e.what() << std::endl;
            out.push_back(describe_error(r.filename, error_kind_to_string(ErrorKind::METADATA_VALIDATION),
                                         e.what()));
        }
    }
    return out;
}

nlohmann::json description_schema() {
    return nlohmann::json::parse(R"({
  "type": "object",
  "properties": {
    "MAPLatitude": {"type": "number", "minimum": -90, "maximum": 90},
    "MAPLongitude": {"type": "number", "minimum": -180, "maximum": 180},
    "MAPCaptureTime": {"type": "string", "pattern": "^[0-9]{4}_[0-9]{2}_[0-9]{2}_[0-9]{2}_[0-9]{2}_[0-9]{2}_[0-9]{3}$"},
    "MAPAltitude": {"type": "number"},
    "MAPCompassHeading": {
      "type": "object",
      "properties": {
        "TrueHeading": {"type": "number"},
        "MagneticHeading": {"type": "number"}
      },
      "required": ["TrueHeading", "MagneticHeading"],
      "additionalProperties": false
    },
    "MAPSequenceUUID": {"type": "string"},
    "MAPOrientation": {"type": "integer"},
    "MAPDeviceMake": {"type": "string"},
    "MAPDeviceModel": {"type": "string"},
    "MAPGPSAccuracyMeters": {"type": "number"},
    "MAPMetaTags": {"type": "object"},
    "filename": {"type": "string"}
  },
  "required": ["MAPLatitude", "MAPLongitude", "MAPCaptureTime", "filename"],
  "additionalProperties": false
})");
}

void write_descriptions(const fs::path& path, const nlohmann::json& descriptions) {
    core::write_text(path, descriptions.dump(2) + "\n");
}

} // namespace geoseq::description
