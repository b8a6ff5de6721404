#include "runner_status.hpp"

#include "tbss_pipeline/core/filesystem.hpp"
#include "tbss_pipeline/core/types.hpp"
#include "tbss_pipeline/pipeline/run_context.hpp"
#include "tbss_pipeline/pipeline/sequencer.hpp"

#include "runner_shared.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int status_command(const std::string &tbss_dir, const std::string &config_path,
                   bool non_fa, bool as_json) {
  using namespace tbss_pipeline;

  fs::path root(tbss_dir);
  if (!fs::exists(root) || !fs::is_directory(root)) {
    std::cerr << "Error: tbss-dir not found: " << tbss_dir << std::endl;
    return 1;
  }

  pipeline::RunLayout layout(fs::absolute(root).lexically_normal());

  // Without --config, use the configuration the last run saved.
  std::string effective_config = config_path;
  if (effective_config.empty() && fs::exists(layout.config_file())) {
    effective_config = layout.config_file().string();
  }

  config::Config cfg;
  try {
    cfg = runner::load_config(effective_config);
  } catch (const std::exception &e) {
    std::cerr << "Error: failed to load/validate config: " << e.what()
              << std::endl;
    return 1;
  }

  std::vector<Measure> measures{Measure::FA};
  if (non_fa || cfg.analysis.non_fa) {
    measures.insert(measures.end(), cfg.analysis.secondary_measures.begin(),
                    cfg.analysis.secondary_measures.end());
  }

  core::LocalFileSystem files;
  const auto reports = pipeline::inspect_run(files, layout, measures);

  if (as_json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &r : reports) {
      out.push_back({{"stage", stage_to_string(r.stage)},
                     {"measure", measure_to_string(r.measure)},
                     {"marker", r.marker},
                     {"complete", r.complete}});
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
  }

  std::cout << "Run directory: " << layout.root().string() << std::endl;
  size_t pending = 0;
  for (const auto &r : reports) {
    if (!r.complete)
      ++pending;
    std::cout << "  " << std::left << std::setw(16) << stage_to_string(r.stage)
              << std::setw(4) << measure_to_string(r.measure)
              << (r.complete ? "skip " : "run  ") << r.marker << std::endl;
  }
  std::cout << pending << " of " << reports.size() << " stages would run"
            << std::endl;
  return 0;
}
