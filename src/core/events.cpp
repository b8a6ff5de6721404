#include "tbss_pipeline/core/events.hpp"
#include "tbss_pipeline/core/utils.hpp"

namespace tbss_pipeline::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    emit(event);
}

void EventEmitter::stage_start(Stage stage, Measure measure) {
    json event = base_event("stage_start");
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["measure"] = measure_to_string(measure);
    emit(event);
}

void EventEmitter::stage_end(Stage stage, Measure measure,
                             const std::string& status, const json& extra) {
    json event = base_event("stage_end");
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["measure"] = measure_to_string(measure);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::task_done(Stage stage, int task_idx, int total_tasks,
                             const std::string& label, bool success) {
    json event = base_event("task_done");
    event["stage"] = stage_to_int(stage);
    event["task_idx"] = task_idx;
    event["total_tasks"] = total_tasks;
    event["label"] = label;
    event["success"] = success;
    emit(event);
}

void EventEmitter::job_submitted(const std::string& job_name,
                                 const std::string& job_id,
                                 const std::string& backend) {
    json event = base_event("job_submitted");
    event["job_name"] = job_name;
    event["job_id"] = job_id;
    event["backend"] = backend;
    emit(event);
}

void EventEmitter::job_finished(const std::string& job_name,
                                const std::string& job_id, bool success,
                                int exit_code) {
    json event = base_event("job_finished");
    event["job_name"] = job_name;
    event["job_id"] = job_id;
    event["success"] = success;
    event["exit_code"] = exit_code;
    emit(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    emit(event);
}

} // namespace tbss_pipeline::core
