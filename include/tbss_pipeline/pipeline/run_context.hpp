#pragma once

#include "tbss_pipeline/config/configuration.hpp"
#include "tbss_pipeline/core/filesystem.hpp"
#include "tbss_pipeline/core/types.hpp"
#include "tbss_pipeline/pipeline/stage_gate.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tbss_pipeline::pipeline {

namespace fs = std::filesystem;

/**
 * Directory layout of one pipeline run and the markers that gate each stage.
 *
 *   <root>/FA/                  written by tbss_1_preproc
 *   <root>/<M>/                 secondary copies (renamed from .staging/<M>)
 *   <root>/stats/               written by tbss_3_postreg
 *   <root>/logs/                stage logs, events, resolved config
 */
class RunLayout {
public:
  explicit RunLayout(fs::path root) : root_(std::move(root)) {}

  const fs::path &root() const { return root_; }
  fs::path stats_dir() const { return root_ / "stats"; }
  fs::path logs_dir() const { return root_ / "logs"; }
  fs::path measure_dir(Measure m) const { return root_ / measure_to_string(m); }
  fs::path staging_dir(Measure m) const {
    return root_ / ".staging" / measure_to_string(m);
  }

  fs::path stage_log(Stage stage) const {
    return logs_dir() / (stage_to_string(stage) + ".log");
  }
  fs::path stage_err(Stage stage) const {
    return logs_dir() / (stage_to_string(stage) + ".err");
  }
  fs::path randomise_log(Measure m) const {
    const std::string name = measure_to_string(m);
    return measure_dir(m) / ("00_tbss_" + name + "_randomise.log");
  }
  fs::path events_file() const { return logs_dir() / "run_events.jsonl"; }
  fs::path config_file() const { return logs_dir() / "config.yaml"; }

  // Markers
  StageMarker copy_marker(Measure m) const {
    return StageMarker::directory(measure_dir(m));
  }
  StageMarker preprocess_marker() const {
    return StageMarker::directory(stats_dir());
  }
  StageMarker project_marker(Measure m) const {
    return StageMarker::file(stats_dir() /
                             ("all_" + measure_to_string(m) + "_skeletonised.nii.gz"));
  }
  StageMarker stats_marker(Measure m) const {
    return StageMarker::file(stats_dir() /
                             ("tbss_" + measure_to_string(m) + "_tfce_p_tstat1.nii.gz"));
  }
  // Fill is complete only when every corrected-p map has its filled sibling;
  // see fill_status().
  std::string corrp_pattern(Measure m) const {
    return "*tbss_" + measure_to_string(m) + "_tfce_corrp_tstat*.nii*";
  }
  static std::string filled_stem(const fs::path &corrp_map);

private:
  fs::path root_;
};

// Values given on the `run` command line. Unset optionals fall back to the
// configuration file.
struct RunOptions {
  std::string tbss_dir;
  std::string sub_list;
  std::string design;
  std::string contrast;
  std::string template_path;
  std::optional<std::string> fa_threshold;
  std::optional<std::string> permutations;
  bool check_design = false;
  bool non_fa = false;
};

/**
 * Resolved, validated inputs of one run. Built once by make_run_context and
 * passed by const reference to every stage.
 */
struct RunContext {
  config::Config cfg; // with command-line overrides applied
  RunLayout layout{fs::path()};
  fs::path subject_list;
  fs::path design_matrix;
  fs::path design_contrast;
  fs::path template_image;

  std::vector<Subject> subjects;       // resolved, one per stem
  std::vector<std::string> omitted;    // list entries without a primary image
  std::vector<std::string> duplicates; // entries listed more than once

  std::vector<Measure> measures() const; // FA first, then enabled secondaries
  std::string tool(const std::string &name) const {
    return config::fsl_tool(cfg, name);
  }
};

// Throws ConfigError for missing or nonexistent inputs, malformed numbers and
// subject lists that resolve to nothing, ValidationError for out-of-range
// configuration and ConsistencyError for a design matrix that does not match
// the resolved subjects. Reads inputs through `files`, writes nothing.
RunContext make_run_context(const config::Config &base, const RunOptions &opts,
                            const core::FileSystem &files);

} // namespace tbss_pipeline::pipeline
