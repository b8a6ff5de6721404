#pragma once

#include "tbss_pipeline/config/configuration.hpp"
#include "tbss_pipeline/core/types.hpp"
#include "tbss_pipeline/exec/process.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tbss_pipeline::scheduler {

namespace fs = std::filesystem;

struct JobRequest {
    std::string name;
    std::vector<std::string> command;
    fs::path work_dir;
    Resources resources;
    fs::path stdout_log;
    fs::path stderr_log;
};

struct JobResult {
    bool success = false;
    int exit_code = 0;
    fs::path stdout_log;
    fs::path stderr_log;
};

/**
 * Reference to a submitted job. Move-only; consumed by JobSubmitter::join.
 * For the local backend it owns the child process, for LSF it carries the
 * scheduler's job id.
 */
class JobHandle {
public:
    JobHandle() = default;
    JobHandle(std::string id, std::string name, fs::path stdout_log, fs::path stderr_log,
              std::unique_ptr<exec::RunningProcess> process = nullptr);

    JobHandle(JobHandle&&) noexcept = default;
    JobHandle& operator=(JobHandle&&) noexcept = default;
    JobHandle(const JobHandle&) = delete;
    JobHandle& operator=(const JobHandle&) = delete;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const fs::path& stdout_log() const { return stdout_log_; }
    const fs::path& stderr_log() const { return stderr_log_; }
    bool valid() const { return !id_.empty(); }

private:
    friend class LocalSubmitter;

    std::string id_;
    std::string name_;
    fs::path stdout_log_;
    fs::path stderr_log_;
    std::unique_ptr<exec::RunningProcess> process_;
};

class JobSubmitter {
public:
    virtual ~JobSubmitter() = default;

    // Non-blocking. Throws SchedulerError when the submission is not accepted.
    virtual JobHandle submit(const JobRequest& request) = 0;

    // Blocks until the job resolves. The handle is invalid afterwards.
    virtual JobResult join(JobHandle& handle) = 0;

    virtual std::string backend_name() const = 0;

    JobResult submit_blocking(const JobRequest& request);
};

// IBM LSF: bsub to submit, bwait to block on a job id.
class LsfSubmitter : public JobSubmitter {
public:
    LsfSubmitter(exec::CommandRunner& runner, std::string submit_command = "bsub",
                 std::string wait_command = "bwait");

    JobHandle submit(const JobRequest& request) override;
    JobResult join(JobHandle& handle) override;
    std::string backend_name() const override { return "lsf"; }

    std::vector<std::string> build_submit_args(const JobRequest& request) const;

private:
    exec::CommandRunner& runner_;
    std::string submit_command_;
    std::string wait_command_;
};

// Runs each job as a direct child process.
class LocalSubmitter : public JobSubmitter {
public:
    explicit LocalSubmitter(exec::CommandRunner& runner);

    JobHandle submit(const JobRequest& request) override;
    JobResult join(JobHandle& handle) override;
    std::string backend_name() const override { return "local"; }

private:
    exec::CommandRunner& runner_;
    int next_id_ = 0;
};

// Parses "Job <1234> is submitted to queue <normal>." Returns empty when no
// id is present.
std::string parse_lsf_job_id(const std::string& bsub_output);

std::unique_ptr<JobSubmitter> make_job_submitter(const config::Config& cfg,
                                                 exec::CommandRunner& runner);

} // namespace tbss_pipeline::scheduler
