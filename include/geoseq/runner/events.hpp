#pragma once

#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace geoseq::runner {

/**
 * JSON-lines progress events for a pipeline run.
 * Written to a stream (stdout by default) and to an optional log file.
 * Safe to call from worker threads.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ofstream* log_file = nullptr, std::ostream* out = &std::cout);

    void emit(const nlohmann::json& event);

    void phase_start(const std::string& run_id, int phase_id, const std::string& phase_name,
                     const nlohmann::json& extra = nlohmann::json::object());

    void phase_end(const std::string& run_id, int phase_id, const std::string& phase_name,
                   const std::string& status, const nlohmann::json& extra = nlohmann::json::object());

    void phase_progress(const std::string& run_id, int phase_id, const std::string& phase_name,
                        int current, int total, const nlohmann::json& extra = nlohmann::json::object());

    void file_error(const std::string& run_id, const std::string& filename,
                    const std::string& error_type, const std::string& message);
    void warning(const std::string& run_id, const std::string& message,
                 const nlohmann::json& extra = nlohmann::json::object());

    void run_start(const std::string& run_id, const nlohmann::json& data);
    void run_end(const std::string& run_id, bool success, const nlohmann::json& data = nlohmann::json::object());
    void run_error(const std::string& run_id, const std::string& error);

private:
    std::ofstream* log_file_;
    std::ostream* out_;
    std::mutex mutex_;

    nlohmann::json make_event(const std::string& type, const std::string& run_id,
                              const nlohmann::json& extra) const;
};

} // namespace geoseq::runner
