#include "tbss_pipeline/core/errors.hpp"
#include "tbss_pipeline/scheduler/job_submitter.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace tbss_pipeline;
using tbss_test::FakeCommandRunner;
using tbss_test::TempDir;

namespace {

scheduler::JobRequest randomise_request() {
  scheduler::JobRequest req;
  req.name = "FA_rdm";
  req.command = {"randomise", "-i", "all_FA_skeletonised", "-o", "tbss_FA"};
  req.work_dir = "/data/run/stats";
  req.resources = Resources{1, 15000, 30000, true, true};
  req.stdout_log = "/data/run/FA/00_tbss_FA_randomise.log";
  return req;
}

} // namespace

TEST_CASE("lsf_submit_args_carry_resources_and_command") {
  FakeCommandRunner runner;
  scheduler::LsfSubmitter lsf(runner);

  auto args = lsf.build_submit_args(randomise_request());
  const std::vector<std::string> expected = {
      "bsub", "-n", "1", "-R", "span[hosts=1]", "-N", "-M", "15000", "-W", "30000",
      "-J", "FA_rdm", "-cwd", "/data/run/stats", "-o", "/data/run/FA/00_tbss_FA_randomise.log",
      "randomise", "-i", "all_FA_skeletonised", "-o", "tbss_FA"};
  REQUIRE(args == expected);

  auto req = randomise_request();
  req.resources.single_host = false;
  req.resources.notify = false;
  args = lsf.build_submit_args(req);
  REQUIRE(std::find(args.begin(), args.end(), "-R") == args.end());
  REQUIRE(std::find(args.begin(), args.end(), "-N") == args.end());
}

TEST_CASE("parse_lsf_job_id_extracts_numeric_id") {
  REQUIRE(scheduler::parse_lsf_job_id("Job <8812> is submitted to queue <long>.\n") == "8812");
  REQUIRE(scheduler::parse_lsf_job_id("Job not submitted.").empty());
}

TEST_CASE("lsf_submit_returns_handle_and_join_waits_on_id") {
  FakeCommandRunner runner;
  runner.script("bsub", [](const exec::Command &) {
    return exec::CommandResult{0, "Job <77> is submitted to default queue <normal>.\n"};
  });
  runner.script("bwait", [](const exec::Command &cmd) {
    return exec::CommandResult{cmd.args.at(2) == "done(77)" ? 0 : 1, ""};
  });

  scheduler::LsfSubmitter lsf(runner);
  auto handle = lsf.submit(randomise_request());
  REQUIRE(handle.id() == "77");
  REQUIRE(handle.name() == "FA_rdm");

  auto result = lsf.join(handle);
  REQUIRE(result.success);
  REQUIRE_FALSE(handle.valid());
  REQUIRE(runner.count("bwait") == 1);
  REQUIRE_THROWS_AS(lsf.join(handle), SchedulerError);
}

TEST_CASE("lsf_submit_failures_raise_scheduler_error") {
  FakeCommandRunner runner;
  scheduler::LsfSubmitter lsf(runner);

  SECTION("rejected") {
    runner.script("bsub", [](const exec::Command &) {
      return exec::CommandResult{255, "Bad resource requirement\n"};
    });
    REQUIRE_THROWS_AS(lsf.submit(randomise_request()), SchedulerError);
  }
  SECTION("no_job_id") {
    runner.script("bsub", [](const exec::Command &) {
      return exec::CommandResult{0, "queued\n"};
    });
    REQUIRE_THROWS_AS(lsf.submit(randomise_request()), SchedulerError);
  }
  SECTION("client_missing") {
    runner.script("bsub", [](const exec::Command &) { return exec::CommandResult{127, ""}; });
    REQUIRE_THROWS_AS(lsf.submit(randomise_request()), SchedulerError);
  }
  SECTION("empty_command") {
    auto req = randomise_request();
    req.command.clear();
    REQUIRE_THROWS_AS(lsf.submit(req), SchedulerError);
  }
}

TEST_CASE("lsf_join_reports_failed_job") {
  FakeCommandRunner runner;
  runner.script("bsub", [](const exec::Command &) {
    return exec::CommandResult{0, "Job <5> is submitted.\n"};
  });
  runner.script("bwait", [](const exec::Command &) { return exec::CommandResult{1, ""}; });

  scheduler::LsfSubmitter lsf(runner);
  auto result = lsf.submit_blocking(randomise_request());
  REQUIRE_FALSE(result.success);
  REQUIRE(result.exit_code == 1);
}

TEST_CASE("local_submitter_runs_job_as_child_process") {
  TempDir tmp;
  exec::LocalCommandRunner runner;
  scheduler::LocalSubmitter local(runner);

  scheduler::JobRequest ok;
  ok.name = "ok";
  ok.command = {"/bin/sh", "-c", "echo done"};
  ok.work_dir = tmp.path();
  ok.stdout_log = tmp / "ok.log";

  scheduler::JobRequest bad;
  bad.name = "bad";
  bad.command = {"/bin/sh", "-c", "exit 4"};

  auto h1 = local.submit(ok);
  auto h2 = local.submit(bad);
  REQUIRE(h1.id() == "local-1");
  REQUIRE(h2.id() == "local-2");

  auto r2 = local.join(h2);
  auto r1 = local.join(h1);
  REQUIRE(r1.success);
  REQUIRE_FALSE(r2.success);
  REQUIRE(r2.exit_code == 4);
  REQUIRE(core::read_text(tmp / "ok.log") == "done\n");
}

TEST_CASE("make_job_submitter_selects_backend") {
  FakeCommandRunner runner;
  config::Config cfg;
  REQUIRE(scheduler::make_job_submitter(cfg, runner)->backend_name() == "lsf");
  cfg.scheduler.backend = "local";
  REQUIRE(scheduler::make_job_submitter(cfg, runner)->backend_name() == "local");
  cfg.scheduler.backend = "slurm";
  REQUIRE_THROWS_AS(scheduler::make_job_submitter(cfg, runner), ConfigError);
}
