#include "tbss_pipeline/pipeline/sequencer.hpp"
#include "tbss_pipeline/core/errors.hpp"
#include "tbss_pipeline/core/utils.hpp"
#include "tbss_pipeline/exec/fan_out.hpp"
#include "tbss_pipeline/pipeline/subjects.hpp"

#include <iostream>

namespace tbss_pipeline::pipeline {

namespace {

// tbss_fill threshold applied to every 1-p map.
constexpr double kFillThreshold = 0.95;

std::string prefix(Stage stage) { return "[" + stage_to_string(stage) + "] "; }

} // namespace

StageSequencer::StageSequencer(const RunContext &ctx,
                               const core::FileSystem &files,
                               exec::CommandRunner &runner,
                               scheduler::JobSubmitter &submitter,
                               core::EventEmitter &emitter)
    : ctx_(ctx), layout_(ctx.layout), files_(files), runner_(runner),
      submitter_(submitter), emitter_(emitter) {}

void StageSequencer::run() {
  try {
    stage_init();
    stage_copy_primary();
    stage_preprocess();
    copy_design_files();

    const std::vector<Measure> measures = ctx_.measures();
    submit_stats(Measure::FA);
    for (Measure m : measures) {
      if (is_primary(m))
        continue;
      stage_copy_secondary(m);
      stage_project(m);
      submit_stats(m);
    }

    for (Measure m : measures) {
      join_and_fill(m);
    }
  } catch (const std::exception &e) {
    emitter_.stage_end(current_stage_, current_measure_, "error",
                       {{"error", e.what()}});
    drain_outstanding();
    throw;
  } catch (...) {
    drain_outstanding();
    throw;
  }

  current_stage_ = Stage::DONE;
  std::cout << prefix(Stage::DONE) << "TBSS analysis completed." << std::endl;
}

bool StageSequencer::gate(Stage stage, Measure measure,
                          const StageMarker &marker) {
  current_stage_ = stage;
  current_measure_ = measure;
  emitter_.stage_start(stage, measure);

  if (is_stage_complete(files_, marker)) {
    std::cout << prefix(stage) << measure_to_string(measure)
              << " already complete (" << marker.describe() << ")"
              << std::endl;
    emitter_.stage_end(stage, measure, "skipped",
                       {{"marker", marker.describe()}});
    return true;
  }
  return false;
}

void StageSequencer::run_tool(Stage stage, Measure measure,
                              std::vector<std::string> args,
                              const fs::path &work_dir) {
  exec::Command cmd;
  cmd.args = std::move(args);
  cmd.work_dir = work_dir;
  cmd.stdout_path = layout_.stage_log(stage);
  cmd.stderr_path = layout_.stage_err(stage);

  const std::string line = core::format_command(cmd.args);
  std::cout << prefix(stage) << line << std::endl;

  ++invocations_;
  int rc = 0;
  try {
    rc = runner_.run(cmd);
  } catch (const ProcessError &e) {
    throw StageError(stage_to_string(stage) + " " + measure_to_string(measure) +
                     ": cannot run '" + line + "': " + e.what());
  }
  if (rc != 0) {
    throw StageError(stage_to_string(stage) + " " + measure_to_string(measure) +
                     ": '" + line + "' exited with code " +
                     std::to_string(rc) + "; see " +
                     cmd.stdout_path.string() + " and " +
                     cmd.stderr_path.string());
  }
}

void StageSequencer::stage_init() {
  current_stage_ = Stage::INIT;
  current_measure_ = Measure::FA;
  emitter_.stage_start(Stage::INIT, Measure::FA);

  for (const auto &missing : ctx_.omitted) {
    std::cerr << "Warning: " << missing
              << " does not exist; subject omitted" << std::endl;
    emitter_.warning("subject omitted, primary image missing: " + missing);
  }
  for (const auto &repeated : ctx_.duplicates) {
    std::cerr << "Warning: " << repeated
              << " is listed more than once; using it once" << std::endl;
    emitter_.warning("duplicate subject list entry ignored: " + repeated);
  }

  std::error_code ec;
  fs::create_directories(layout_.logs_dir(), ec);
  if (ec) {
    throw IOError("Cannot create " + layout_.logs_dir().string() + ": " +
                  ec.message());
  }

  std::cout << prefix(Stage::INIT) << ctx_.subjects.size() << " subjects, "
            << ctx_.omitted.size() << " omitted" << std::endl;
  emitter_.stage_end(Stage::INIT, Measure::FA, "ok",
                     {{"subjects", ctx_.subjects.size()},
                      {"omitted", ctx_.omitted},
                      {"duplicates", ctx_.duplicates}});
}

namespace {

// Runs the copy tasks and throws StageError naming every failed subject.
void run_copy_tasks(const std::vector<exec::FanOutTask> &tasks, int workers,
                    Measure measure, const RunLayout &layout,
                    core::EventEmitter &emitter) {
  std::cout << prefix(Stage::COPY) << measure_to_string(measure) << ": "
            << tasks.size() << " subjects" << std::endl;

  auto report = exec::fan_out(
      tasks, workers,
      [&](size_t idx, size_t total, const std::string &label, bool success) {
        emitter.task_done(Stage::COPY, static_cast<int>(idx),
                          static_cast<int>(total), label, success);
      });

  if (report.ok()) {
    return;
  }

  std::vector<std::string> labels;
  for (const auto &f : report.failures) {
    std::cerr << prefix(Stage::COPY) << measure_to_string(measure) << " "
              << f.label << " failed: " << f.error << std::endl;
    emitter.error("COPY " + measure_to_string(measure) + " " + f.label +
                  ": " + f.error);
    labels.push_back(f.label);
  }
  throw StageError("COPY " + measure_to_string(measure) + ": " +
                   std::to_string(report.failures.size()) + " of " +
                   std::to_string(report.total) + " copies failed (" +
                   core::join(labels, ", ") + "); see " +
                   layout.stage_err(Stage::COPY).string());
}

} // namespace

void StageSequencer::stage_copy_primary() {
  if (gate(Stage::COPY, Measure::FA, layout_.copy_marker(Measure::FA))) {
    return;
  }

  std::vector<exec::FanOutTask> tasks;
  for (const auto &s : ctx_.subjects) {
    exec::Command cmd;
    cmd.args = {ctx_.tool("imcp"), s.primary.string(),
                (layout_.root() / s.id).string()};
    cmd.stdout_path = layout_.stage_log(Stage::COPY);
    cmd.stderr_path = layout_.stage_err(Stage::COPY);
    tasks.push_back({s.id, [this, cmd]() {
                       ++invocations_;
                       return runner_.run(cmd);
                     }});
  }

  run_copy_tasks(tasks, ctx_.cfg.runtime.parallel_copies, Measure::FA, layout_,
                 emitter_);
  emitter_.stage_end(Stage::COPY, Measure::FA, "ok",
                     {{"copied", tasks.size()}});
}

void StageSequencer::stage_preprocess() {
  static const Stage kBlock[] = {Stage::PREPROC, Stage::REGISTER,
                                 Stage::POSTREG, Stage::PRESTATS};

  const StageMarker marker = layout_.preprocess_marker();
  if (gate(Stage::PREPROC, Measure::FA, marker)) {
    for (Stage s : kBlock) {
      if (s == Stage::PREPROC)
        continue;
      emitter_.stage_start(s, Measure::FA);
      emitter_.stage_end(s, Measure::FA, "skipped",
                         {{"marker", marker.describe()}});
    }
    return;
  }

  std::vector<std::string> images;
  for (const auto &p : files_.glob(layout_.root(), "*.nii*")) {
    images.push_back(p.filename().string());
  }
  if (images.empty()) {
    if (files_.is_directory(layout_.measure_dir(Measure::FA))) {
      throw StageError("PREPROC: " + layout_.measure_dir(Measure::FA).string() +
                       " exists without " + layout_.stats_dir().string() +
                       "; preprocessing was interrupted. Remove it and rerun");
    }
    throw StageError("PREPROC: no images to preprocess in " +
                     layout_.root().string());
  }

  std::vector<std::string> preproc = {ctx_.tool("tbss_1_preproc")};
  preproc.insert(preproc.end(), images.begin(), images.end());
  run_tool(Stage::PREPROC, Measure::FA, preproc, layout_.root());
  emitter_.stage_end(Stage::PREPROC, Measure::FA, "ok",
                     {{"images", images.size()}});

  current_stage_ = Stage::REGISTER;
  emitter_.stage_start(Stage::REGISTER, Measure::FA);
  run_tool(Stage::REGISTER, Measure::FA,
           {ctx_.tool("tbss_2_reg"), "-t", ctx_.template_image.string()},
           layout_.root());
  emitter_.stage_end(Stage::REGISTER, Measure::FA, "ok");

  current_stage_ = Stage::POSTREG;
  emitter_.stage_start(Stage::POSTREG, Measure::FA);
  run_tool(Stage::POSTREG, Measure::FA, {ctx_.tool("tbss_3_postreg"), "-S"},
           layout_.root());
  emitter_.stage_end(Stage::POSTREG, Measure::FA, "ok");

  current_stage_ = Stage::PRESTATS;
  emitter_.stage_start(Stage::PRESTATS, Measure::FA);
  if (!files_.is_directory(layout_.stats_dir())) {
    throw StageError("PRESTATS: tbss_3_postreg did not create " +
                     layout_.stats_dir().string());
  }
  run_tool(Stage::PRESTATS, Measure::FA,
           {ctx_.tool("tbss_4_prestats"),
            core::format_decimal(ctx_.cfg.analysis.fa_threshold)},
           layout_.stats_dir());
  emitter_.stage_end(Stage::PRESTATS, Measure::FA, "ok",
                     {{"fa_threshold", ctx_.cfg.analysis.fa_threshold}});
}

void StageSequencer::copy_design_files() {
  const fs::path mat = layout_.stats_dir() / "design.mat";
  const fs::path con = layout_.stats_dir() / "design.con";

  if (files_.exists(mat) &&
      core::sha256_file(mat) != core::sha256_file(ctx_.design_matrix)) {
    const std::string msg =
        "design matrix differs from the one in " + mat.string() +
        "; completed statistics were computed against the previous design";
    std::cerr << "Warning: " << msg << std::endl;
    emitter_.warning(msg);
  }

  core::copy_file_overwrite(ctx_.design_matrix, mat);
  core::copy_file_overwrite(ctx_.design_contrast, con);
}

void StageSequencer::stage_copy_secondary(Measure measure) {
  if (gate(Stage::COPY, measure, layout_.copy_marker(measure))) {
    return;
  }

  const fs::path staging = layout_.staging_dir(measure);
  std::error_code ec;
  fs::remove_all(staging, ec);
  if (ec) {
    throw IOError("Cannot clear " + staging.string() + ": " + ec.message());
  }
  fs::create_directories(staging, ec);
  if (ec) {
    throw IOError("Cannot create " + staging.string() + ": " + ec.message());
  }

  std::vector<exec::FanOutTask> tasks;
  for (const auto &s : ctx_.subjects) {
    exec::Command cmd;
    cmd.args = {ctx_.tool("imcp"), "", (staging / s.id).string()};
    cmd.stdout_path = layout_.stage_log(Stage::COPY);
    cmd.stderr_path = layout_.stage_err(Stage::COPY);
    tasks.push_back({s.id, [this, cmd, s, measure]() mutable {
                       auto artifact =
                           find_secondary_artifact(files_, s, measure);
                       if (!artifact) {
                         throw IOError("no " + measure_to_string(measure) +
                                       " image matching " +
                                       (s.data_dir / (s.id + "*" +
                                                      measure_to_string(measure) +
                                                      "*"))
                                           .string());
                       }
                       cmd.args[1] = artifact->string();
                       ++invocations_;
                       return runner_.run(cmd);
                     }});
  }

  run_copy_tasks(tasks, ctx_.cfg.runtime.parallel_copies, measure, layout_,
                 emitter_);

  // The marker directory appears only once every copy has landed.
  fs::rename(staging, layout_.measure_dir(measure), ec);
  if (ec) {
    throw IOError("Cannot move " + staging.string() + " to " +
                  layout_.measure_dir(measure).string() + ": " + ec.message());
  }
  // Removes .staging only when no other measure is left in it.
  fs::remove(staging.parent_path(), ec);

  emitter_.stage_end(Stage::COPY, measure, "ok", {{"copied", tasks.size()}});
}

void StageSequencer::stage_project(Measure measure) {
  if (gate(Stage::PROJECT, measure, layout_.project_marker(measure))) {
    return;
  }
  run_tool(Stage::PROJECT, measure,
           {ctx_.tool("tbss_non_FA"), measure_to_string(measure)},
           layout_.root());
  emitter_.stage_end(Stage::PROJECT, measure, "ok");
}

void StageSequencer::submit_stats(Measure measure) {
  if (outstanding_.count(measure) != 0) {
    throw StageError("STATS " + measure_to_string(measure) +
                     ": a randomise job for this measure is already running");
  }
  if (gate(Stage::STATS, measure, layout_.stats_marker(measure))) {
    return;
  }

  const std::string m = measure_to_string(measure);
  const fs::path log = layout_.randomise_log(measure);
  std::error_code ec;
  fs::create_directories(log.parent_path(), ec);
  if (ec) {
    throw IOError("Cannot create " + log.parent_path().string() + ": " +
                  ec.message());
  }

  scheduler::JobRequest req;
  req.name = m + "_rdm";
  req.command = {ctx_.tool("randomise"),
                 "-i", "all_" + m + "_skeletonised",
                 "-o", "tbss_" + m,
                 "-m", "mean_FA_skeleton_mask",
                 "-d", "design.mat",
                 "-t", "design.con",
                 "-n", std::to_string(ctx_.cfg.analysis.permutations),
                 "--T2", "--uncorrp"};
  req.work_dir = layout_.stats_dir();
  req.resources = ctx_.cfg.scheduler.randomise;
  req.stdout_log = log;
  req.stderr_log = log;

  std::cout << prefix(Stage::STATS) << core::format_command(req.command)
            << std::endl;
  ++invocations_;
  scheduler::JobHandle handle = submitter_.submit(req);
  std::cout << prefix(Stage::STATS) << req.name << " submitted as "
            << handle.id() << " (" << submitter_.backend_name() << ")"
            << std::endl;
  emitter_.job_submitted(req.name, handle.id(), submitter_.backend_name());
  emitter_.stage_end(Stage::STATS, measure, "submitted",
                     {{"job_id", handle.id()}, {"log", log.string()}});
  outstanding_.emplace(measure, std::move(handle));
}

void StageSequencer::join_and_fill(Measure measure) {
  const std::string m = measure_to_string(measure);

  auto it = outstanding_.find(measure);
  if (it != outstanding_.end()) {
    current_stage_ = Stage::STATS;
    current_measure_ = measure;
    scheduler::JobHandle handle = std::move(it->second);
    outstanding_.erase(it);

    const std::string name = handle.name();
    const std::string id = handle.id();
    std::cout << prefix(Stage::STATS) << "waiting for " << name << " ("
              << id << ")" << std::endl;
    scheduler::JobResult result = submitter_.join(handle);
    emitter_.job_finished(name, id, result.success, result.exit_code);
    if (!result.success) {
      throw StageError("STATS " + m + ": job " + name + " (" + id +
                       ") failed with code " +
                       std::to_string(result.exit_code) + "; see " +
                       result.stdout_log.string());
    }
  }

  current_stage_ = Stage::POSTSTATS_FILL;
  current_measure_ = measure;
  emitter_.stage_start(Stage::POSTSTATS_FILL, measure);

  const FillStatus status = fill_status(files_, layout_, measure);
  if (status.maps.empty()) {
    const std::string msg = "no corrected-p maps for " + m + " in " +
                            layout_.stats_dir().string() + "; nothing to fill";
    std::cerr << "Warning: " << msg << std::endl;
    emitter_.warning(msg);
    emitter_.stage_end(Stage::POSTSTATS_FILL, measure, "ok", {{"filled", 0}});
    return;
  }
  if (status.complete()) {
    std::cout << prefix(Stage::POSTSTATS_FILL) << m << " already complete ("
              << status.maps.size() << " filled maps)" << std::endl;
    emitter_.stage_end(Stage::POSTSTATS_FILL, measure, "skipped",
                       {{"marker", layout_.corrp_pattern(measure) + " filled"}});
    return;
  }

  const std::string threshold = core::format_decimal(kFillThreshold);
  for (const auto &map : status.pending) {
    run_tool(Stage::POSTSTATS_FILL, measure,
             {ctx_.tool("tbss_fill"), map.filename().string(), threshold,
              "mean_FA", RunLayout::filled_stem(map)},
             layout_.stats_dir());
  }
  emitter_.stage_end(Stage::POSTSTATS_FILL, measure, "ok",
                     {{"filled", status.pending.size()},
                      {"maps", status.maps.size()}});
}

void StageSequencer::drain_outstanding() {
  while (!outstanding_.empty()) {
    auto it = outstanding_.begin();
    scheduler::JobHandle handle = std::move(it->second);
    outstanding_.erase(it);

    const std::string name = handle.name();
    const std::string id = handle.id();
    std::cerr << "Waiting for outstanding job " << name << " (" << id
              << ") before exiting" << std::endl;
    try {
      scheduler::JobResult result = submitter_.join(handle);
      emitter_.job_finished(name, id, result.success, result.exit_code);
    } catch (const std::exception &e) {
      std::cerr << "Error: join of " << name << " failed: " << e.what()
                << std::endl;
      emitter_.error("join of " + name + " (" + id + ") failed: " + e.what());
    }
  }
}

FillStatus fill_status(const core::FileSystem &files, const RunLayout &layout,
                       Measure measure) {
  FillStatus out;
  for (const auto &map : files.glob(layout.stats_dir(), layout.corrp_pattern(measure))) {
    const std::string stem = core::remove_image_ext(map.filename().string());
    if (core::ends_with(stem, "_filled")) {
      continue;
    }
    out.maps.push_back(map);
    if (files.glob(layout.stats_dir(), RunLayout::filled_stem(map) + ".nii*").empty()) {
      out.pending.push_back(map);
    }
  }
  return out;
}

std::vector<GateReport> inspect_run(const core::FileSystem &files,
                                    const RunLayout &layout,
                                    const std::vector<Measure> &measures) {
  std::vector<GateReport> out;
  auto add = [&](Stage stage, Measure m, const StageMarker &marker) {
    out.push_back({stage, m, marker.describe(),
                   is_stage_complete(files, marker)});
  };

  add(Stage::COPY, Measure::FA, layout.copy_marker(Measure::FA));
  add(Stage::PREPROC, Measure::FA, layout.preprocess_marker());
  for (Measure m : measures) {
    if (is_primary(m))
      continue;
    add(Stage::COPY, m, layout.copy_marker(m));
    add(Stage::PROJECT, m, layout.project_marker(m));
  }
  for (Measure m : measures) {
    add(Stage::STATS, m, layout.stats_marker(m));
    const FillStatus fill = fill_status(files, layout, m);
    out.push_back({Stage::POSTSTATS_FILL, m,
                   std::to_string(fill.maps.size() - fill.pending.size()) + "/" +
                       std::to_string(fill.maps.size()) + " of " +
                       layout.corrp_pattern(m) + " filled",
                   fill.complete()});
  }
  return out;
}

} // namespace tbss_pipeline::pipeline
