#include "tbss_pipeline/config/configuration.hpp"
#include "tbss_pipeline/core/errors.hpp"
#include "tbss_pipeline/core/events.hpp"
#include "tbss_pipeline/core/filesystem.hpp"
#include "tbss_pipeline/core/utils.hpp"
#include "tbss_pipeline/exec/process.hpp"
#include "tbss_pipeline/pipeline/run_context.hpp"
#include "tbss_pipeline/pipeline/sequencer.hpp"
#include "tbss_pipeline/scheduler/job_submitter.hpp"

#include "runner_shared.hpp"
#include "runner_status.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

using namespace tbss_pipeline;

struct RunArgs {
  pipeline::RunOptions opts;
  std::string fa_threshold;
  std::string permutations;
  std::string config_path;
  std::string scheduler_backend;
  int parallel_copies = -1;
};

int run_command(RunArgs args) {
  core::LocalFileSystem files;
  pipeline::RunContext ctx;
  try {
    config::Config cfg = runner::load_config(args.config_path);
    if (!args.scheduler_backend.empty()) {
      cfg.scheduler.backend = args.scheduler_backend;
    }
    if (args.parallel_copies >= 0) {
      cfg.runtime.parallel_copies = args.parallel_copies;
    }
    if (!args.fa_threshold.empty()) {
      args.opts.fa_threshold = args.fa_threshold;
    }
    if (!args.permutations.empty()) {
      args.opts.permutations = args.permutations;
    }
    ctx = pipeline::make_run_context(cfg, args.opts, files);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const pipeline::RunLayout &layout = ctx.layout;
  std::error_code ec;
  fs::create_directories(layout.logs_dir(), ec);
  if (ec) {
    std::cerr << "Error: cannot create " << layout.logs_dir() << ": "
              << ec.message() << std::endl;
    return 1;
  }

  // Append so a resumed run keeps the history of earlier attempts
  std::ofstream event_log_file(layout.events_file(),
                               std::ios::out | std::ios::app);
  if (!event_log_file) {
    std::cerr << "Error: cannot open " << layout.events_file() << std::endl;
    return 1;
  }
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter(run_id, log_file);

  try {
    ctx.cfg.save(layout.config_file());

    emitter.run_start(
        {{"tbss_dir", layout.root().string()},
         {"subject_list", ctx.subject_list.string()},
         {"design", ctx.design_matrix.string()},
         {"design_sha256", core::sha256_file(ctx.design_matrix)},
         {"contrast", ctx.design_contrast.string()},
         {"contrast_sha256", core::sha256_file(ctx.design_contrast)},
         {"template", ctx.template_image.string()},
         {"fa_threshold", ctx.cfg.analysis.fa_threshold},
         {"permutations", ctx.cfg.analysis.permutations},
         {"check_design", ctx.cfg.analysis.check_design},
         {"non_fa", ctx.cfg.analysis.non_fa},
         {"scheduler", ctx.cfg.scheduler.backend}});

    std::cout << "Run ID: " << run_id << std::endl;
    std::cout << "Output: " << layout.root().string() << std::endl;

    exec::LocalCommandRunner runner;
    auto submitter = scheduler::make_job_submitter(ctx.cfg, runner);

    pipeline::StageSequencer sequencer(ctx, files, runner, *submitter, emitter);
    sequencer.run();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(e.what());
    emitter.run_end(false, "error");
    return 1;
  }

  emitter.run_end(true, "ok");
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"TBSS pipeline runner"};
  app.require_subcommand(1);

  RunArgs run_args;
  auto run_cmd = app.add_subcommand("run", "Run the TBSS pipeline for one design");
  run_cmd->add_option("--tbss-dir", run_args.opts.tbss_dir,
                      "TBSS output directory (created if absent)");
  run_cmd->add_option("--sub-list", run_args.opts.sub_list,
                      "Subject list: one FA image path per line");
  run_cmd->add_option("--design", run_args.opts.design, "FSL design matrix (.mat)");
  run_cmd->add_option("--contrast", run_args.opts.contrast, "FSL contrast file (.con)");
  run_cmd->add_option("--template", run_args.opts.template_path,
                      "Registration target [default: $FSLDIR/data/standard/FMRIB58_FA_1mm.nii.gz]");
  run_cmd->add_option("--fa-threshold", run_args.fa_threshold,
                      "FA threshold for skeletonization, 0.15 recommended for neonates [default: 0.20]");
  run_cmd->add_option("--perm", run_args.permutations,
                      "Number of permutations [default: 5000]");
  run_cmd->add_flag("--check-design", run_args.opts.check_design,
                    "Check the design matrix row count against the subject list");
  run_cmd->add_flag("--non-FA-tbss", run_args.opts.non_fa,
                    "Also analyse AD, MD and RD");
  run_cmd->add_option("--config", run_args.config_path, "Path to config.yaml");
  run_cmd->add_option("--scheduler", run_args.scheduler_backend,
                      "Scheduler backend: lsf|local")
      ->check(CLI::IsMember({"lsf", "local"}));
  run_cmd->add_option("--parallel-copies", run_args.parallel_copies,
                      "Concurrent copy workers (0 = one per subject)")
      ->check(CLI::NonNegativeNumber);

  std::string status_dir;
  std::string status_config;
  bool status_non_fa = false;
  bool status_json = false;
  auto status_cmd = app.add_subcommand("status", "Show which stages a rerun would skip");
  status_cmd->add_option("--tbss-dir", status_dir, "TBSS output directory")->required();
  status_cmd->add_option("--config", status_config, "Path to config.yaml");
  status_cmd->add_flag("--non-FA-tbss", status_non_fa, "Include AD, MD and RD stages");
  status_cmd->add_flag("--json", status_json, "Print the report as JSON");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    // Help output still ends the program with a failure status.
    const int rc = app.exit(e);
    return rc == 0 ? 1 : rc;
  }

  if (run_cmd->parsed()) {
    return run_command(run_args);
  }
  if (status_cmd->parsed()) {
    return status_command(status_dir, status_config, status_non_fa, status_json);
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
