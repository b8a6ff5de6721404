#include "tbss_pipeline/config/configuration.hpp"
#include "tbss_pipeline/core/errors.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tbss_pipeline;
using tbss_test::TempDir;
using tbss_test::touch;

TEST_CASE("config_defaults_are_valid") {
  config::Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.analysis.fa_threshold == 0.2);
  REQUIRE(cfg.analysis.permutations == 5000);
  REQUIRE(cfg.analysis.secondary_measures.size() == 3);
  REQUIRE(cfg.scheduler.backend == "lsf");
  REQUIRE(cfg.scheduler.randomise.memory_mb == 15000);
  REQUIRE(cfg.scheduler.pipeline.memory_mb == 35000);
}

TEST_CASE("config_loads_partial_yaml_over_defaults") {
  TempDir tmp;
  touch(tmp / "tbss.yaml", R"(analysis:
  fa_threshold: 0.15
  secondary_measures: [MD]
runtime:
  parallel_copies: 4
scheduler:
  backend: local
  randomise:
    memory_mb: 8000
)");
  auto cfg = config::Config::load(tmp / "tbss.yaml");
  REQUIRE(cfg.analysis.fa_threshold == 0.15);
  REQUIRE(cfg.analysis.permutations == 5000);
  REQUIRE(cfg.analysis.secondary_measures == std::vector<Measure>{Measure::MD});
  REQUIRE(cfg.runtime.parallel_copies == 4);
  REQUIRE(cfg.scheduler.backend == "local");
  REQUIRE(cfg.scheduler.randomise.memory_mb == 8000);
  REQUIRE(cfg.scheduler.randomise.walltime_min == 30000);
}

TEST_CASE("config_save_then_load_preserves_values") {
  TempDir tmp;
  config::Config cfg;
  cfg.analysis.permutations = 100;
  cfg.analysis.non_fa = true;
  cfg.fsl.bin_dir = "/opt/fsl/bin";
  cfg.batch.runner = "/usr/local/bin/tbss_runner";
  cfg.save(tmp / "out.yaml");

  auto back = config::Config::load(tmp / "out.yaml");
  REQUIRE(back.analysis.permutations == 100);
  REQUIRE(back.analysis.non_fa);
  REQUIRE(back.fsl.bin_dir == "/opt/fsl/bin");
  REQUIRE(back.batch.runner == "/usr/local/bin/tbss_runner");
}

TEST_CASE("config_rejects_unknown_or_malformed_values") {
  TempDir tmp;
  touch(tmp / "measure.yaml", "analysis:\n  secondary_measures: [MO]\n");
  touch(tmp / "type.yaml", "analysis:\n  permutations: lots\n");
  touch(tmp / "syntax.yaml", "analysis: [unclosed\n");
  REQUIRE_THROWS_AS(config::Config::load(tmp / "measure.yaml"), ConfigError);
  REQUIRE_THROWS_AS(config::Config::load(tmp / "type.yaml"), ConfigError);
  REQUIRE_THROWS_AS(config::Config::load(tmp / "syntax.yaml"), ConfigError);
  REQUIRE_THROWS_AS(config::Config::load(tmp / "missing.yaml"), ConfigError);
}

TEST_CASE("config_validate_reports_out_of_range_fields") {
  config::Config cfg;
  SECTION("threshold") {
    cfg.analysis.fa_threshold = 1.2;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
  SECTION("backend") {
    cfg.scheduler.backend = "pbs";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
  SECTION("primary_as_secondary") {
    cfg.analysis.secondary_measures.push_back(Measure::FA);
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
  SECTION("repeated_secondary") {
    cfg.analysis.secondary_measures = {Measure::AD, Measure::RD, Measure::AD};
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
  SECTION("resources") {
    cfg.scheduler.randomise.cpus = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
  SECTION("subject_pattern") {
    cfg.batch.subject_path_pattern = "fixed/path_FA.nii.gz";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
}

TEST_CASE("saved_config_has_no_fill_threshold") {
  TempDir tmp;
  config::Config cfg;
  cfg.save(tmp / "out.yaml");
  REQUIRE(core::read_text(tmp / "out.yaml").find("fill_threshold") == std::string::npos);
}

TEST_CASE("fsl_tool_prefers_configured_bin_dir") {
  config::Config cfg;
  cfg.fsl.bin_dir = "/opt/fsl/bin";
  REQUIRE(config::fsl_tool(cfg, "randomise") == "/opt/fsl/bin/randomise");
}
