#include "geoseq/core/utils.hpp"
#include "geoseq/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>

#include <openssl/rand.h>

namespace geoseq::core {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Parses "<date><sep><time>[.fraction][Z|+hh:mm|-hhmm]". The date separator is
// '-' or ':', the date/time separator is 'T' or ' '.
std::optional<double> parse_datetime(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.size() < 19) {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, sec = 0;
    char s1 = 0, s2 = 0, sep = 0, c1 = 0, c2 = 0;
    if (std::sscanf(text.c_str(), "%4d%c%2d%c%2d%c%2d%c%2d%c%2d",
                    &year, &s1, &month, &s2, &day, &sep, &hour, &c1, &minute, &c2, &sec) != 11) {
        return std::nullopt;
    }
    if (!((s1 == '-' && s2 == '-') || (s1 == ':' && s2 == ':'))) return std::nullopt;
    if (sep != 'T' && sep != ' ') return std::nullopt;
    if (c1 != ':' || c2 != ':') return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
    if (hour > 23 || minute > 59 || sec > 60) return std::nullopt;

    size_t pos = 19;
    double fraction = 0.0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        double scale = 0.1;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            fraction += (text[pos] - '0') * scale;
            scale /= 10.0;
            ++pos;
        }
    }

    double offset_sec = 0.0;
    if (pos < text.size()) {
        const char tz = text[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            int oh = 0, om = 0;
            const std::string rest = text.substr(pos + 1);
            if (std::sscanf(rest.c_str(), "%2d:%2d", &oh, &om) != 2 &&
                std::sscanf(rest.c_str(), "%2d%2d", &oh, &om) != 2) {
                return std::nullopt;
            }
            offset_sec = (oh * 3600.0 + om * 60.0) * (tz == '+' ? 1.0 : -1.0);
            pos = text.size();
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    return unix_time_from_utc(year, month, day, hour, minute, sec + fraction) - offset_sec;
}

} // namespace

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

double unix_time_from_utc(int year, int month, int day, int hour, int minute, double second) {
    const int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                         static_cast<unsigned>(day));
    return static_cast<double>(days) * 86400.0 + hour * 3600.0 + minute * 60.0 + second;
}

std::string format_capture_time(double unix_time) {
    // Round to microseconds first, then truncate to milliseconds
    const int64_t micros = std::llround(unix_time * 1e6);
    const int64_t millis = floor_div(micros, 1000);
    const int64_t secs = floor_div(millis, 1000);
    const int ms = static_cast<int>(millis - secs * 1000);

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y_%m_%d_%H_%M_%S") << '_'
        << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

std::optional<double> parse_capture_time(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, sec = 0;
    char frac[16] = {0};
    if (std::sscanf(text.c_str(), "%4d_%2d_%2d_%2d_%2d_%2d_%15[0-9]",
                    &year, &month, &day, &hour, &minute, &sec, frac) != 7) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || sec > 59) {
        return std::nullopt;
    }
    double fraction = 0.0;
    double scale = 0.1;
    for (const char* p = frac; *p; ++p) {
        fraction += (*p - '0') * scale;
        scale /= 10.0;
    }
    return unix_time_from_utc(year, month, day, hour, minute, sec + fraction);
}

std::optional<double> parse_iso8601(const std::string& text) {
    return parse_datetime(text);
}

std::optional<double> parse_exif_datetime(const std::string& text) {
    return parse_datetime(text);
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

std::vector<fs::path> discover_files(const std::vector<fs::path>& inputs, bool recursive,
                                     const std::vector<std::string>& extensions) {
    auto matches = [&](const fs::path& p) {
        const std::string name = p.filename().string();
        if (name.empty() || name[0] == '.') {
            return false;
        }
        const std::string ext = to_lower(p.extension().string());
        return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
    };

    std::set<fs::path> found;
    for (const auto& input : inputs) {
        if (fs::is_regular_file(input)) {
            if (matches(input)) {
                found.insert(input);
            }
        } else if (fs::is_directory(input)) {
            if (recursive) {
                for (const auto& entry : fs::recursive_directory_iterator(input)) {
                    if (entry.is_regular_file() && matches(entry.path())) {
                        found.insert(entry.path());
                    }
                }
            } else {
                for (const auto& entry : fs::directory_iterator(input)) {
                    if (entry.is_regular_file() && matches(entry.path())) {
                        found.insert(entry.path());
                    }
                }
            }
        } else {
            throw IOError("Import file or directory not found: " + input.string());
        }
    }

    return std::vector<fs::path>(found.begin(), found.end());
}

std::string make_uuid4() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw GeoseqError("Failed to generate random bytes for UUID");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::ostringstream oss;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c) && c != '\0'; };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    if (!str.empty() && str.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

std::optional<double> parse_double(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

} // namespace geoseq::core
