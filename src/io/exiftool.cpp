#include "geoseq/io/exiftool.hpp"
#include "geoseq/core/errors.hpp"

#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>

#include <cstdlib>

namespace geoseq::io {

namespace {

std::optional<std::string> resolve_executable(const std::string& candidate) {
    if (candidate.empty()) {
        return std::nullopt;
    }
    const fs::path p(candidate);
    if (p.has_parent_path()) {
        std::error_code ec;
        if (fs::is_regular_file(p, ec)) {
            return candidate;
        }
        return std::nullopt;
    }
    const QString found = QStandardPaths::findExecutable(QString::fromStdString(candidate));
    if (found.isEmpty()) {
        return std::nullopt;
    }
    return found.toStdString();
}

} // namespace

QProcessExiftoolRunner::QProcessExiftoolRunner(std::string executable, int timeout_sec)
    : executable_(std::move(executable)), timeout_sec_(timeout_sec) {}

std::string QProcessExiftoolRunner::run(const fs::path& path) {
    QProcess proc;
    proc.setProcessChannelMode(QProcess::SeparateChannels);

    const QStringList args = {
        "-q", "-r", "-n", "-ee",
        "-api", "LargeFileSupport=1",
        "-X",
        QString::fromStdString(path.string()),
    };
    proc.start(QString::fromStdString(executable_), args);

    if (!proc.waitForStarted(3000)) {
        throw ParseError("Failed to start exiftool: " + executable_);
    }
    if (!proc.waitForFinished(timeout_sec_ * 1000)) {
        proc.kill();
        proc.waitForFinished(1000);
        throw ParseError("exiftool timed out after " + std::to_string(timeout_sec_) +
                         "s on " + path.string());
    }
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        const QString err = QString::fromUtf8(proc.readAllStandardError()).trimmed();
        throw ParseError("exiftool exited with code " + std::to_string(proc.exitCode()) +
                         (err.isEmpty() ? "" : ": " + err.toStdString()));
    }

    const QByteArray out = proc.readAllStandardOutput();
    if (out.trimmed().isEmpty()) {
        throw ParseError("exiftool produced no output for " + path.string());
    }
    return std::string(out.constData(), static_cast<size_t>(out.size()));
}

std::optional<std::string> find_exiftool(const std::string& configured_path) {
    if (const char* env = std::getenv("GEOSEQ_EXIFTOOL_PATH")) {
        if (auto found = resolve_executable(env)) {
            return found;
        }
    }
    if (auto found = resolve_executable(configured_path)) {
        return found;
    }
    return resolve_executable("exiftool");
}

} // namespace geoseq::io
