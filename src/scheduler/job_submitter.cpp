#include "tbss_pipeline/scheduler/job_submitter.hpp"
#include "tbss_pipeline/core/errors.hpp"
#include "tbss_pipeline/core/utils.hpp"

#include <regex>

namespace tbss_pipeline::scheduler {

JobHandle::JobHandle(std::string id, std::string name, fs::path stdout_log,
                     fs::path stderr_log, std::unique_ptr<exec::RunningProcess> process)
    : id_(std::move(id)),
      name_(std::move(name)),
      stdout_log_(std::move(stdout_log)),
      stderr_log_(std::move(stderr_log)),
      process_(std::move(process)) {}

JobResult JobSubmitter::submit_blocking(const JobRequest& request) {
    JobHandle handle = submit(request);
    return join(handle);
}

std::string parse_lsf_job_id(const std::string& bsub_output) {
    static const std::regex kJobId("Job <([0-9]+)>");
    std::smatch match;
    if (std::regex_search(bsub_output, match, kJobId)) {
        return match[1].str();
    }
    return {};
}

LsfSubmitter::LsfSubmitter(exec::CommandRunner& runner, std::string submit_command,
                           std::string wait_command)
    : runner_(runner),
      submit_command_(std::move(submit_command)),
      wait_command_(std::move(wait_command)) {}

std::vector<std::string> LsfSubmitter::build_submit_args(const JobRequest& request) const {
    const Resources& r = request.resources;
    std::vector<std::string> args = {submit_command_, "-n", std::to_string(r.cpus)};
    if (r.single_host) {
        args.push_back("-R");
        args.push_back("span[hosts=1]");
    }
    if (r.notify) {
        args.push_back("-N");
    }
    args.insert(args.end(), {"-M", std::to_string(r.memory_mb),
                             "-W", std::to_string(r.walltime_min),
                             "-J", request.name});
    if (!request.work_dir.empty()) {
        args.push_back("-cwd");
        args.push_back(request.work_dir.string());
    }
    if (!request.stdout_log.empty()) {
        args.push_back("-o");
        args.push_back(request.stdout_log.string());
    }
    if (!request.stderr_log.empty()) {
        args.push_back("-e");
        args.push_back(request.stderr_log.string());
    }
    args.insert(args.end(), request.command.begin(), request.command.end());
    return args;
}

JobHandle LsfSubmitter::submit(const JobRequest& request) {
    if (request.command.empty()) {
        throw SchedulerError("Job '" + request.name + "' has no command");
    }

    exec::Command cmd;
    cmd.args = build_submit_args(request);
    cmd.work_dir = request.work_dir;

    exec::CommandResult res;
    try {
        res = runner_.capture(cmd);
    } catch (const ProcessError& e) {
        throw SchedulerError("Cannot start " + submit_command_ + ": " + e.what());
    }

    if (res.exit_code == 127) {
        throw SchedulerError("Cannot start " + submit_command_ + " (not found)");
    }
    if (res.exit_code != 0) {
        throw SchedulerError(submit_command_ + " rejected job '" + request.name +
                             "' (exit code " + std::to_string(res.exit_code) + "): " +
                             core::trim(res.output));
    }

    std::string id = parse_lsf_job_id(res.output);
    if (id.empty()) {
        throw SchedulerError(submit_command_ + " returned no job id for '" + request.name +
                             "': " + core::trim(res.output));
    }
    return JobHandle(id, request.name, request.stdout_log, request.stderr_log);
}

JobResult LsfSubmitter::join(JobHandle& handle) {
    if (!handle.valid()) {
        throw SchedulerError("Join on an invalid job handle");
    }
    JobHandle consumed = std::move(handle);

    exec::Command cmd;
    cmd.args = {wait_command_, "-w", "done(" + consumed.id() + ")"};

    int rc = 0;
    try {
        rc = runner_.run(cmd);
    } catch (const ProcessError& e) {
        throw SchedulerError("Cannot start " + wait_command_ + ": " + e.what());
    }
    if (rc == 127) {
        throw SchedulerError("Cannot start " + wait_command_ + " (not found)");
    }

    JobResult result;
    result.success = rc == 0;
    result.exit_code = rc;
    result.stdout_log = consumed.stdout_log();
    result.stderr_log = consumed.stderr_log();
    return result;
}

LocalSubmitter::LocalSubmitter(exec::CommandRunner& runner) : runner_(runner) {}

JobHandle LocalSubmitter::submit(const JobRequest& request) {
    if (request.command.empty()) {
        throw SchedulerError("Job '" + request.name + "' has no command");
    }

    exec::Command cmd;
    cmd.args = request.command;
    cmd.work_dir = request.work_dir;
    cmd.stdout_path = request.stdout_log;
    cmd.stderr_path = request.stderr_log;

    std::unique_ptr<exec::RunningProcess> process;
    try {
        process = runner_.start(cmd);
    } catch (const ProcessError& e) {
        throw SchedulerError("Cannot start job '" + request.name + "': " + e.what());
    }

    std::string id = "local-" + std::to_string(++next_id_);
    return JobHandle(id, request.name, request.stdout_log, request.stderr_log,
                     std::move(process));
}

JobResult LocalSubmitter::join(JobHandle& handle) {
    if (!handle.valid() || !handle.process_) {
        throw SchedulerError("Join on an invalid job handle");
    }
    JobHandle consumed = std::move(handle);

    int rc = consumed.process_->wait();

    JobResult result;
    result.success = rc == 0;
    result.exit_code = rc;
    result.stdout_log = consumed.stdout_log();
    result.stderr_log = consumed.stderr_log();
    return result;
}

std::unique_ptr<JobSubmitter> make_job_submitter(const config::Config& cfg,
                                                 exec::CommandRunner& runner) {
    if (cfg.scheduler.backend == "lsf") {
        return std::make_unique<LsfSubmitter>(runner, cfg.scheduler.submit_command,
                                              cfg.scheduler.wait_command);
    }
    if (cfg.scheduler.backend == "local") {
        return std::make_unique<LocalSubmitter>(runner);
    }
    throw ConfigError("Unknown scheduler backend: " + cfg.scheduler.backend);
}

} // namespace tbss_pipeline::scheduler
