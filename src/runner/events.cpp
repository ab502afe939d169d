#include "geoseq/runner/events.hpp"
#include "geoseq/core/utils.hpp"

namespace geoseq::runner {

EventEmitter::EventEmitter(std::ofstream* log_file, std::ostream* out)
    : log_file_(log_file), out_(out) {}

nlohmann::json EventEmitter::make_event(const std::string& type, const std::string& run_id,
                                        const nlohmann::json& extra) const {
    nlohmann::json event;
    event["type"] = type;
    event["run_id"] = run_id;
    event["ts"] = core::get_iso_timestamp();

    if (!extra.empty() && extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    return event;
}

void EventEmitter::emit(const nlohmann::json& event) {
    const std::string line = event.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    if (out_) {
        (*out_) << line << std::endl;
        out_->flush();
    }

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << std::endl;
        log_file_->flush();
    }
}

void EventEmitter::phase_start(const std::string& run_id, int phase_id,
                               const std::string& phase_name,
                               const nlohmann::json& extra) {
    nlohmann::json event = make_event("phase_start", run_id, extra);
    event["phase"] = phase_id;
    event["phase_name"] = phase_name;
    emit(event);
}

void EventEmitter::phase_end(const std::string& run_id, int phase_id,
                             const std::string& phase_name, const std::string& status,
                             const nlohmann::json& extra) {
    nlohmann::json event = make_event("phase_end", run_id, extra);
    event["phase"] = phase_id;
    event["phase_name"] = phase_name;
    event["status"] = status;
    emit(event);
}

void EventEmitter::phase_progress(const std::string& run_id, int phase_id,
                                  const std::string& phase_name,
                                  int current, int total,
                                  const nlohmann::json& extra) {
    nlohmann::json event = make_event("phase_progress", run_id, extra);
    event["phase"] = phase_id;
    event["phase_name"] = phase_name;
    event["current"] = current;
    event["total"] = total;
    emit(event);
}

void EventEmitter::file_error(const std::string& run_id, const std::string& filename,
                              const std::string& error_type, const std::string& message) {
    nlohmann::json event = make_event("file_error", run_id, nlohmann::json::object());
    event["filename"] = filename;
    event["error_type"] = error_type;
    event["message"] = message;
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           const nlohmann::json& extra) {
    nlohmann::json event = make_event("warning", run_id, extra);
    event["message"] = message;
    emit(event);
}

void EventEmitter::run_start(const std::string& run_id, const nlohmann::json& data) {
    emit(make_event("run_start", run_id, data));
}

void EventEmitter::run_end(const std::string& run_id, bool success, const nlohmann::json& data) {
    nlohmann::json event = make_event("run_end", run_id, data);
    event["success"] = success;
    event["status"] = success ? "ok" : "error";
    emit(event);
}

void EventEmitter::run_error(const std::string& run_id, const std::string& error) {
    nlohmann::json event = make_event("run_error", run_id, nlohmann::json::object());
    event["error"] = error;
    emit(event);
}

} // namespace geoseq::runner
