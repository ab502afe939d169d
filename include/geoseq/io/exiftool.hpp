#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace geoseq::io {

namespace fs = std::filesystem;

// Produces exiftool's RDF/XML output for one file
class ExiftoolRunner {
public:
    virtual ~ExiftoolRunner() = default;

    // Throws ParseError when the tool fails, times out or prints nothing
    virtual std::string run(const fs::path& path) = 0;
};

// Runs the exiftool binary through QProcess with a timeout
class QProcessExiftoolRunner : public ExiftoolRunner {
public:
    QProcessExiftoolRunner(std::string executable, int timeout_sec);

    std::string run(const fs::path& path) override;

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
    int timeout_sec_;
};

// Resolves the exiftool executable: GEOSEQ_EXIFTOOL_PATH, then the configured
// path, then a PATH lookup. Empty when nothing usable is found.
std::optional<std::string> find_exiftool(const std::string& configured_path);

} // namespace geoseq::io
