#include "tbss_pipeline/exec/process.hpp"
#include "tbss_pipeline/core/errors.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tbss_pipeline::exec {

namespace {

int open_log_file(const fs::path& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw ProcessError("Cannot open " + path.string() + ": " + std::strerror(errno));
    }
    return fd;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

int wait_for(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ProcessError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    return decode_status(status);
}

class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

// Forks and execs `cmd`. When `capture_fd` is >= 0 it becomes the child's
// stdout, overriding cmd.stdout_path.
pid_t spawn(const Command& cmd, int capture_fd) {
    if (cmd.args.empty()) {
        throw ProcessError("Empty command");
    }
    if (!cmd.work_dir.empty()) {
        std::error_code ec;
        if (!fs::is_directory(cmd.work_dir, ec)) {
            throw ProcessError("Working directory does not exist: " + cmd.work_dir.string());
        }
    }

    FdGuard out_fd;
    FdGuard err_fd;
    if (capture_fd < 0 && !cmd.stdout_path.empty()) {
        out_fd.reset(open_log_file(cmd.stdout_path));
    }
    if (!cmd.stderr_path.empty()) {
        err_fd.reset(open_log_file(cmd.stderr_path));
    }

    // argv is built before fork so the child only calls async-signal-safe
    // functions.
    std::vector<char*> argv;
    argv.reserve(cmd.args.size() + 1U);
    for (const auto& arg : cmd.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* work_dir = cmd.work_dir.empty() ? nullptr : cmd.work_dir.c_str();
    int child_out = capture_fd >= 0 ? capture_fd : out_fd.get();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (child_out >= 0 && ::dup2(child_out, STDOUT_FILENO) < 0) {
            _exit(127);
        }
        if (err_fd.get() >= 0 && ::dup2(err_fd.get(), STDERR_FILENO) < 0) {
            _exit(127);
        }
        if (work_dir && ::chdir(work_dir) != 0) {
            _exit(127);
        }
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    return pid;
}

class LocalProcess : public RunningProcess {
public:
    explicit LocalProcess(pid_t pid) : pid_(pid) {}

    ~LocalProcess() override {
        // Reap an unjoined child so it does not linger as a zombie.
        if (pid_ > 0) {
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    int wait() override {
        if (pid_ <= 0) {
            throw ProcessError("Process already waited on");
        }
        pid_t pid = pid_;
        pid_ = -1;
        return wait_for(pid);
    }

private:
    pid_t pid_;
};

} // namespace

std::unique_ptr<RunningProcess> LocalCommandRunner::start(const Command& cmd) {
    return std::make_unique<LocalProcess>(spawn(cmd, -1));
}

CommandResult LocalCommandRunner::capture(const Command& cmd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw ProcessError(std::string("pipe failed: ") + std::strerror(errno));
    }
    FdGuard read_end(fds[0]);
    FdGuard write_end(fds[1]);

    pid_t pid = spawn(cmd, write_end.get());
    write_end.reset();

    CommandResult result;
    char buffer[4096];
    for (;;) {
        ssize_t n = ::read(read_end.get(), buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            wait_for(pid);
            throw ProcessError(std::string("read failed: ") + std::strerror(errno));
        }
    }

    result.exit_code = wait_for(pid);
    return result;
}

} // namespace tbss_pipeline::exec
