#pragma once

#include "geoseq/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace geoseq::description {

// Image description of one successful capture
nlohmann::json describe_capture(const CaptureRecord& record);

// {"error": {"type", "message"}, "filename"}
nlohmann::json describe_error(const fs::path& filename, const std::string& type, const std::string& message);

// Throws MetadataValidationError when a description does not match the output schema
void validate_description(const nlohmann::json& desc);

// True for {"error": ..., "filename": ...} entries
bool is_error_description(const nlohmann::json& desc);

/**
 * One entry per record, in record order. Records with an error become error
 * entries; a description failing validation is replaced by a
 * MetadataValidationError entry.
 */
nlohmann::json assemble_descriptions(const std::vector<CaptureRecord>& records);

// JSON schema of a single description entry
nlohmann::json description_schema();

void write_descriptions(const fs::path& path, const nlohmann::json& descriptions);

} // namespace geoseq::description
