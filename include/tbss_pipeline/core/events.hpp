#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace tbss_pipeline::core {

using json = nlohmann::json;

/**
 * Event emission for pipeline runs.
 * One JSON object per line; safe to call from fan-out worker threads.
 */
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status);

    void stage_start(Stage stage, Measure measure);
    void stage_end(Stage stage, Measure measure, const std::string& status,
                   const json& extra = json::object());

    void task_done(Stage stage, int task_idx, int total_tasks,
                   const std::string& label, bool success);

    void job_submitted(const std::string& job_name, const std::string& job_id,
                       const std::string& backend);
    void job_finished(const std::string& job_name, const std::string& job_id,
                      bool success, int exit_code);

    void warning(const std::string& message);
    void error(const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::string run_id_;
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace tbss_pipeline::core
