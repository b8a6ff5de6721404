#pragma once

#include "tbss_pipeline/core/events.hpp"
#include "tbss_pipeline/core/filesystem.hpp"
#include "tbss_pipeline/core/types.hpp"
#include "tbss_pipeline/exec/process.hpp"
#include "tbss_pipeline/pipeline/run_context.hpp"
#include "tbss_pipeline/pipeline/stage_gate.hpp"
#include "tbss_pipeline/scheduler/job_submitter.hpp"

#include <atomic>
#include <map>
#include <string>
#include <vector>

namespace tbss_pipeline::pipeline {

/**
 * Drives one design through INIT, COPY, PREPROC..PRESTATS, STATS and
 * POSTSTATS_FILL. Every stage is skipped when its marker exists, so a rerun
 * resumes after the last completed stage. Statistics jobs run in the
 * background and are joined before their fill; on any failure every
 * outstanding job is joined before the error propagates.
 */
class StageSequencer {
public:
  StageSequencer(const RunContext &ctx, const core::FileSystem &files,
                 exec::CommandRunner &runner,
                 scheduler::JobSubmitter &submitter,
                 core::EventEmitter &emitter);

  // Throws ConsistencyError, StageError, SchedulerError or IOError.
  void run();

  // Number of external stage commands launched (copies, FSL tools, jobs).
  int invocations() const { return invocations_.load(); }

private:
  void stage_init();
  void stage_copy_primary();
  void stage_preprocess();
  void copy_design_files();
  void stage_copy_secondary(Measure measure);
  void stage_project(Measure measure);
  void submit_stats(Measure measure);
  void join_and_fill(Measure measure);
  void drain_outstanding();

  bool gate(Stage stage, Measure measure, const StageMarker &marker);
  void run_tool(Stage stage, Measure measure, std::vector<std::string> args,
                const fs::path &work_dir);

  const RunContext &ctx_;
  const RunLayout &layout_;
  const core::FileSystem &files_;
  exec::CommandRunner &runner_;
  scheduler::JobSubmitter &submitter_;
  core::EventEmitter &emitter_;

  std::map<Measure, scheduler::JobHandle> outstanding_;
  Stage current_stage_ = Stage::INIT;
  Measure current_measure_ = Measure::FA;
  std::atomic<int> invocations_{0};
};

// Gate decision for one stage, as reported by `tbss_runner status`.
struct GateReport {
  Stage stage = Stage::INIT;
  Measure measure = Measure::FA;
  std::string marker;
  bool complete = false;
};

// Corrected-p maps of one measure and those still lacking a filled sibling.
struct FillStatus {
  std::vector<fs::path> maps;
  std::vector<fs::path> pending;
  bool complete() const { return !maps.empty() && pending.empty(); }
};

FillStatus fill_status(const core::FileSystem &files, const RunLayout &layout,
                       Measure measure);

std::vector<GateReport> inspect_run(const core::FileSystem &files,
                                    const RunLayout &layout,
                                    const std::vector<Measure> &measures);

} // namespace tbss_pipeline::pipeline
