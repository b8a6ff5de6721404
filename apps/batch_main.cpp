#include "tbss_pipeline/batch/design_enumerator.hpp"
#include "tbss_pipeline/config/arguments.hpp"
#include "tbss_pipeline/config/configuration.hpp"
#include "tbss_pipeline/core/events.hpp"
#include "tbss_pipeline/core/utils.hpp"
#include "tbss_pipeline/exec/process.hpp"
#include "tbss_pipeline/scheduler/job_submitter.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int main(int argc, char *argv[]) {
  using namespace tbss_pipeline;

  CLI::App app{"TBSS batch launcher: one pipeline job per design"};

  std::string designs_dir, data_dir, out_dir, config_path, runner_path,
      scheduler_backend;
  bool wait = false;

  app.add_option("--designs-dir", designs_dir,
                 "Root of <group>/<design>/ directories")
      ->required();
  app.add_option("--data-dir", data_dir, "Root of per-subject data")->required();
  app.add_option("--out-dir", out_dir, "Output root; runs land in <out>/TBSS/<group>/<design>")
      ->required();
  app.add_option("--config", config_path, "Path to config.yaml, forwarded to every run");
  app.add_option("--runner", runner_path, "tbss_runner executable [default: batch.runner]");
  app.add_option("--scheduler", scheduler_backend, "Scheduler backend: lsf|local")
      ->check(CLI::IsMember({"lsf", "local"}));
  app.add_flag("--wait", wait,
               "Wait for every design job and fail if any failed (always on with the local backend)");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    const int rc = app.exit(e);
    return rc == 0 ? 1 : rc;
  }

  config::Config cfg;
  batch::BatchInputs inputs;
  try {
    cfg = runner::load_config(config_path);
    if (!runner_path.empty()) {
      cfg.batch.runner = runner_path;
    }
    if (!scheduler_backend.empty()) {
      cfg.scheduler.backend = scheduler_backend;
    }
    cfg.validate();
    inputs.designs_root = config::require_existing_dir(designs_dir, "--designs-dir");
    inputs.data_root = config::require_existing_dir(data_dir, "--data-dir");
    inputs.out_root = fs::absolute(out_dir).lexically_normal();
    if (!config_path.empty()) {
      inputs.config_file = fs::absolute(config_path);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const fs::path batch_root = inputs.out_root / cfg.batch.output_subdir;
  std::error_code ec;
  fs::create_directories(batch_root, ec);
  if (ec) {
    std::cerr << "Error: cannot create " << batch_root << ": " << ec.message()
              << std::endl;
    return 1;
  }

  std::ofstream event_log_file(batch_root / "batch_events.jsonl",
                               std::ios::out | std::ios::app);
  if (!event_log_file) {
    std::cerr << "Error: cannot open " << (batch_root / "batch_events.jsonl")
              << std::endl;
    return 1;
  }
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter(core::get_run_id(), log_file);
  emitter.run_start({{"designs_dir", inputs.designs_root.string()},
                     {"data_dir", inputs.data_root.string()},
                     {"out_dir", inputs.out_root.string()},
                     {"runner", cfg.batch.runner},
                     {"scheduler", cfg.scheduler.backend},
                     {"wait", wait}});

  exec::LocalCommandRunner runner;
  try {
    auto submitter = scheduler::make_job_submitter(cfg, runner);
    batch::DesignEnumerator enumerator(cfg, *submitter, emitter);
    auto submitted = enumerator.submit_all(inputs);
    std::cout << submitted.size() << " design(s) submitted" << std::endl;

    // Local jobs are children of this process and are reaped here.
    if (!wait && submitter->backend_name() != "local") {
      emitter.run_end(true, "submitted");
      return 0;
    }

    const size_t failed = enumerator.join_all(submitted);
    if (failed > 0) {
      emitter.run_end(false, std::to_string(failed) + " design(s) failed");
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(e.what());
    emitter.run_end(false, "error");
    return 1;
  }

  emitter.run_end(true, "ok");
  return 0;
}
