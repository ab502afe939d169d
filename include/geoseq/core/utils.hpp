#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace geoseq::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// Seconds since the unix epoch for a UTC civil time
double unix_time_from_utc(int year, int month, int day, int hour, int minute, double second);

// "YYYY_MM_DD_HH_MM_SS_mmm" in UTC
std::string format_capture_time(double unix_time);
std::optional<double> parse_capture_time(const std::string& text);

// ISO 8601 as found in GPX files, e.g. 2021-06-07T20:25:30.5Z or +02:00 offsets
std::optional<double> parse_iso8601(const std::string& text);

// EXIF style "YYYY:MM:DD HH:MM:SS[.fff][Z|+hh:mm]"; naive values are taken as UTC
std::optional<double> parse_exif_datetime(const std::string& text);

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
std::vector<fs::path> discover_files(const std::vector<fs::path>& inputs, bool recursive,
                                     const std::vector<std::string>& extensions);

// Random (version 4) UUID
std::string make_uuid4();

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::optional<double> parse_double(const std::string& text);

} // namespace geoseq::core
