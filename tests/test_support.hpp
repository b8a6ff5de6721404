#pragma once

#include "tbss_pipeline/core/filesystem.hpp"
#include "tbss_pipeline/core/utils.hpp"
#include "tbss_pipeline/exec/process.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace tbss_test {

namespace fs = std::filesystem;
using tbss_pipeline::exec::Command;
using tbss_pipeline::exec::CommandResult;
using tbss_pipeline::exec::RunningProcess;

// Unique scratch directory, removed with its contents on destruction.
class TempDir {
public:
  TempDir() {
    std::string templ = (fs::temp_directory_path() / "tbss_test_XXXXXX").string();
    if (::mkdtemp(templ.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = templ;
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const std::string &rel) const { return path_ / rel; }

private:
  fs::path path_;
};

inline void touch(const fs::path &p, const std::string &content = "x\n") {
  fs::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::out | std::ios::trunc);
  out << content;
}

// In-memory filesystem for gate and resolution tests.
class FakeFileSystem : public tbss_pipeline::core::FileSystem {
public:
  void add_file(const fs::path &p) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.insert(p);
    add_parents(p);
  }
  void add_dir(const fs::path &p) {
    std::lock_guard<std::mutex> lock(mutex_);
    dirs_.insert(p);
    add_parents(p);
  }

  bool exists(const fs::path &path) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.count(path) > 0 || dirs_.count(path) > 0;
  }
  bool is_directory(const fs::path &path) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirs_.count(path) > 0;
  }
  std::vector<fs::path> glob(const fs::path &dir,
                             const std::string &pattern) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<fs::path> out;
    auto collect = [&](const std::set<fs::path> &entries) {
      for (const auto &p : entries) {
        if (p.parent_path() == dir &&
            tbss_pipeline::core::glob_match(pattern, p.filename().string())) {
          out.push_back(p);
        }
      }
    };
    collect(files_);
    collect(dirs_);
    std::sort(out.begin(), out.end());
    return out;
  }

private:
  void add_parents(const fs::path &p) {
    for (fs::path parent = p.parent_path();
         !parent.empty() && parent != parent.root_path();
         parent = parent.parent_path()) {
      dirs_.insert(parent);
    }
  }

  mutable std::mutex mutex_;
  std::set<fs::path> files_;
  std::set<fs::path> dirs_;
};

class FinishedProcess : public RunningProcess {
public:
  explicit FinishedProcess(int rc) : rc_(rc) {}
  int wait() override { return rc_; }

private:
  int rc_;
};

/**
 * Records every command and emulates the FSL tools and the LSF client on the
 * real filesystem. Commands complete synchronously; start() hands back an
 * already finished process. Individual tools can be overridden with script().
 */
class FakeCommandRunner : public tbss_pipeline::exec::CommandRunner {
public:
  using Script = std::function<CommandResult(const Command &)>;

  void script(const std::string &tool, Script s) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_[tool] = std::move(s);
  }

  // Any command with an argument containing `token` exits with 1.
  void fail_when(const std::string &token) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_tokens_.push_back(token);
  }

  std::unique_ptr<RunningProcess> start(const Command &cmd) override {
    return std::make_unique<FinishedProcess>(dispatch(cmd).exit_code);
  }

  CommandResult capture(const Command &cmd) override { return dispatch(cmd); }

  std::vector<Command> commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
  }

  size_t count(const std::string &tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(commands_.begin(), commands_.end(), [&](const Command &c) {
          return !c.args.empty() && tool_name(c) == tool;
        }));
  }

  static std::string tool_name(const Command &cmd) {
    return fs::path(cmd.args.front()).filename().string();
  }

private:
  CommandResult dispatch(const Command &cmd) {
    Script script;
    bool fail = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      commands_.push_back(cmd);
      auto it = scripts_.find(tool_name(cmd));
      if (it != scripts_.end()) {
        script = it->second;
      }
      for (const auto &token : fail_tokens_) {
        for (const auto &arg : cmd.args) {
          if (arg.find(token) != std::string::npos) {
            fail = true;
          }
        }
      }
    }
    if (fail) {
      return {1, ""};
    }
    if (script) {
      return script(cmd);
    }
    return emulate(cmd);
  }

  CommandResult emulate(const Command &cmd) {
    const std::string tool = tool_name(cmd);
    const auto &a = cmd.args;
    const fs::path wd = cmd.work_dir.empty() ? fs::current_path() : cmd.work_dir;

    if (tool == "imcp") {
      if (a.size() != 3 || !fs::exists(a[1])) {
        return {1, ""};
      }
      touch(fs::path(a[2] + ".nii.gz"));
      return {0, ""};
    }
    if (tool == "tbss_1_preproc") {
      fs::create_directories(wd / "FA");
      fs::create_directories(wd / "origdata");
      for (size_t i = 1; i < a.size(); ++i) {
        const std::string stem = tbss_pipeline::core::remove_image_ext(a[i]);
        fs::rename(wd / a[i], wd / "origdata" / a[i]);
        touch(wd / "FA" / (stem + "_FA.nii.gz"));
      }
      return {0, ""};
    }
    if (tool == "tbss_2_reg") {
      return {0, ""};
    }
    if (tool == "tbss_3_postreg") {
      touch(wd / "stats" / "mean_FA.nii.gz");
      touch(wd / "stats" / "all_FA.nii.gz");
      return {0, ""};
    }
    if (tool == "tbss_4_prestats") {
      touch(wd / "all_FA_skeletonised.nii.gz");
      touch(wd / "mean_FA_skeleton_mask.nii.gz");
      return {0, ""};
    }
    if (tool == "tbss_non_FA") {
      touch(wd / "stats" / ("all_" + a.at(1) + "_skeletonised.nii.gz"));
      return {0, ""};
    }
    if (tool == "randomise") {
      std::string out;
      for (size_t i = 1; i + 1 < a.size(); ++i) {
        if (a[i] == "-o") out = a[i + 1];
      }
      touch(wd / (out + "_tfce_p_tstat1.nii.gz"));
      touch(wd / (out + "_tfce_corrp_tstat1.nii.gz"));
      touch(wd / (out + "_tfce_corrp_tstat2.nii.gz"));
      return {0, ""};
    }
    if (tool == "tbss_fill") {
      touch(wd / (a.at(4) + ".nii.gz"));
      return {0, ""};
    }
    if (tool == "bsub") {
      return emulate_bsub(cmd);
    }
    if (tool == "bwait") {
      // bwait -w done(<id>)
      const std::string cond = a.at(2);
      const std::string id = cond.substr(5, cond.size() - 6);
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = lsf_jobs_.find(id);
      return {it != lsf_jobs_.end() && it->second == 0 ? 0 : 1, ""};
    }
    return {127, ""};
  }

  CommandResult emulate_bsub(const Command &cmd) {
    static const std::set<std::string> kWithValue = {"-n", "-R", "-M", "-W", "-J",
                                                     "-o", "-e", "-cwd"};
    Command job;
    job.work_dir = cmd.work_dir;
    size_t i = 1;
    while (i < cmd.args.size() && cmd.args[i].size() > 1 && cmd.args[i][0] == '-') {
      if (cmd.args[i] == "-cwd" && i + 1 < cmd.args.size()) {
        job.work_dir = cmd.args[i + 1];
      }
      i += kWithValue.count(cmd.args[i]) ? 2 : 1;
    }
    job.args.assign(cmd.args.begin() + static_cast<long>(i), cmd.args.end());
    if (job.args.empty()) {
      return {255, "Job not submitted.\n"};
    }

    const int rc = dispatch(job).exit_code;
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(1000 + lsf_jobs_.size());
    lsf_jobs_[id] = rc;
    return {0, "Job <" + id + "> is submitted to default queue <normal>.\n"};
  }

  mutable std::mutex mutex_;
  std::vector<Command> commands_;
  std::map<std::string, Script> scripts_;
  std::vector<std::string> fail_tokens_;
  std::map<std::string, int> lsf_jobs_;
};

} // namespace tbss_test
