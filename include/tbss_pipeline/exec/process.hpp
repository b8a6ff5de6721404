#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tbss_pipeline::exec {

namespace fs = std::filesystem;

// External command description. Empty paths inherit the parent's working
// directory or stream; log paths are opened in append mode.
struct Command {
    std::vector<std::string> args;
    fs::path work_dir;
    fs::path stdout_path;
    fs::path stderr_path;
};

struct CommandResult {
    int exit_code = 0;
    std::string output; // captured stdout
};

// A started child process. wait() blocks until exit and returns the exit
// code (128 + signal for signalled children); it may be called once.
class RunningProcess {
public:
    virtual ~RunningProcess() = default;
    virtual int wait() = 0;
};

/**
 * Launches external commands. Exit code 127 means the program could not be
 * executed. Throws ProcessError when the process cannot be spawned at all.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual std::unique_ptr<RunningProcess> start(const Command& cmd) = 0;
    virtual CommandResult capture(const Command& cmd) = 0;

    int run(const Command& cmd) { return start(cmd)->wait(); }
};

class LocalCommandRunner : public CommandRunner {
public:
    std::unique_ptr<RunningProcess> start(const Command& cmd) override;
    CommandResult capture(const Command& cmd) override;
};

} // namespace tbss_pipeline::exec
