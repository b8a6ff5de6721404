#include "tbss_pipeline/exec/fan_out.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace tbss_pipeline::exec {

FanOutReport fan_out(const std::vector<FanOutTask>& tasks, int max_workers,
                     const TaskDoneCallback& on_done, const WorkerSpawner& spawn) {
    FanOutReport report;
    report.total = tasks.size();
    if (tasks.empty()) {
        return report;
    }

    size_t workers_count = tasks.size();
    if (max_workers > 0) {
        workers_count = std::min(workers_count, static_cast<size_t>(max_workers));
    }

    std::atomic<size_t> next{0};
    std::mutex failures_mutex;

    auto worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1);
            if (i >= tasks.size()) {
                break;
            }

            const FanOutTask& task = tasks[i];
            std::string error;
            try {
                int rc = task.run();
                if (rc != 0) {
                    error = "exit code " + std::to_string(rc);
                }
            } catch (const std::exception& e) {
                error = e.what();
            } catch (...) {
                error = "unknown_error";
            }

            const bool success = error.empty();
            if (!success) {
                std::lock_guard<std::mutex> lock(failures_mutex);
                report.failures.push_back({i, task.label, error});
            }
            if (on_done) {
                on_done(i, tasks.size(), task.label, success);
            }
        }
    };

    if (workers_count > 1) {
        std::vector<std::thread> workers;
        workers.reserve(workers_count);
        for (size_t w = 0; w < workers_count; ++w) {
            try {
                if (spawn) {
                    workers.push_back(spawn(worker));
                } else {
                    workers.emplace_back(worker);
                }
            } catch (const std::system_error&) {
                // Running workers drain the remaining tasks.
                break;
            }
        }
        if (workers.empty()) {
            worker();
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    std::sort(report.failures.begin(), report.failures.end(),
              [](const TaskFailure& a, const TaskFailure& b) { return a.index < b.index; });
    return report;
}

} // namespace tbss_pipeline::exec
