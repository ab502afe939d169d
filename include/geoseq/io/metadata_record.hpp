#pragma once

#include "geoseq/io/exiftool.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geoseq::io {

namespace fs = std::filesystem;

/**
 * Flat metadata of one file as "Group:Tag" -> text pairs, in document order.
 * Repeated keys are kept (exiftool -ee emits one entry per embedded sample).
 */
struct MetadataRecord {
    std::string about; // source file path as reported by the tool
    std::vector<std::pair<std::string, std::string>> entries;

    void add(const std::string& key, const std::string& value);

    std::optional<std::string> get(const std::string& key) const;
    std::vector<std::string> get_all(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    bool has(const std::string& key) const;
};

// Parses exiftool -X output. One record per rdf:Description.
std::vector<MetadataRecord> parse_exiftool_xml(const std::string& xml);

// Record whose source path matches the file, comparing full paths first, then file names
const MetadataRecord* find_record_for(const std::vector<MetadataRecord>& records, const fs::path& file);

// Reads flat metadata records for a file
class MetadataReader {
public:
    virtual ~MetadataReader() = default;
    virtual MetadataRecord read(const fs::path& path) = 0;
};

class ExiftoolMetadataReader : public MetadataReader {
public:
    explicit ExiftoolMetadataReader(ExiftoolRunner& runner) : runner_(runner) {}

    MetadataRecord read(const fs::path& path) override;

private:
    ExiftoolRunner& runner_;
};

} // namespace geoseq::io
