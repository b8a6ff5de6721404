#pragma once

#include "tbss_pipeline/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tbss_pipeline::config {

namespace fs = std::filesystem;

struct AnalysisConfig {
  double fa_threshold = 0.2;    // 0.15 recommended for neonates
  int permutations = 5000;
  bool check_design = false;
  bool non_fa = false;
  std::vector<Measure> secondary_measures{Measure::AD, Measure::MD, Measure::RD};
  int design_header_rows = 3;
  std::string template_path; // empty: $FSLDIR/data/standard/FMRIB58_FA_1mm.nii.gz
};

struct FslConfig {
  std::string bin_dir; // empty: $FSLDIR/bin when set, else PATH lookup
};

struct RuntimeConfig {
  int parallel_copies = 0; // 0: one worker per subject
};

struct SchedulerConfig {
  std::string backend = "lsf"; // lsf | local
  std::string submit_command = "bsub";
  std::string wait_command = "bwait";
  Resources randomise{1, 15000, 30000, true, true};
  Resources pipeline{1, 35000, 15000, true, true};
};

struct BatchConfig {
  std::string include_list = "grp.design.include.txt";
  std::string design_matrix = "grp.design.mat";
  std::string design_contrast = "grp.design.con";
  std::string subject_list = "subs.list.txt";
  std::string subject_path_pattern =
      "{subject}/dwi_run-01/Tensor/{subject}_ses-001_run-01_FA.nii.gz";
  std::string output_subdir = "TBSS";
  std::string run_subdir = "tbss";
  std::string runner = "tbss_runner";
  bool check_design = true; // forwarded to every design run
  bool non_fa = true;
};

struct Config {
  AnalysisConfig analysis;
  FslConfig fsl;
  RuntimeConfig runtime;
  SchedulerConfig scheduler;
  BatchConfig batch;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

// Template image used by tbss_2_reg when analysis.template is empty.
fs::path default_template_path();

// Resolves an FSL tool name against fsl.bin_dir, then $FSLDIR/bin. Returns the
// bare name when neither is set so the PATH lookup of execvp applies.
std::string fsl_tool(const Config &cfg, const std::string &tool);

} // namespace tbss_pipeline::config
