#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace tbss_pipeline::exec {

// One independent unit of work. `run` returns an exit code; non-zero or a
// thrown exception marks the task failed.
struct FanOutTask {
    std::string label;
    std::function<int()> run;
};

struct TaskFailure {
    size_t index = 0;
    std::string label;
    std::string error;
};

struct FanOutReport {
    size_t total = 0;
    std::vector<TaskFailure> failures; // sorted by index

    bool ok() const { return failures.empty(); }
};

using TaskDoneCallback =
    std::function<void(size_t index, size_t total, const std::string& label, bool success)>;

// Starts one worker thread. Throws std::system_error when no thread can be
// created, as the std::thread constructor does.
using WorkerSpawner = std::function<std::thread(std::function<void()> body)>;

/**
 * Runs every task on a pool of worker threads and returns once all have
 * finished. Tasks start in input order. A failing task never stops its
 * siblings. max_workers <= 0 uses one worker per task. `on_done` may be
 * invoked concurrently from several workers.
 *
 * When a worker cannot be started the pool shrinks to the workers already
 * running; with none running the tasks run on the calling thread.
 */
FanOutReport fan_out(const std::vector<FanOutTask>& tasks, int max_workers,
                     const TaskDoneCallback& on_done = {},
                     const WorkerSpawner& spawn = {});

} // namespace tbss_pipeline::exec
