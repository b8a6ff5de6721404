#include "tbss_pipeline/core/events.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace tbss_pipeline;

namespace {

std::vector<core::json> parse_lines(const std::string &text) {
  std::vector<core::json> out;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    out.push_back(core::json::parse(line));
  }
  return out;
}

} // namespace

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
  std::ostringstream out;
  core::EventEmitter emitter("run42", out);

  emitter.run_start({{"tbss_dir", "/tmp/x"}});
  emitter.stage_start(Stage::COPY, Measure::MD);
  emitter.stage_end(Stage::COPY, Measure::MD, "skipped", {{"marker", "/tmp/x/MD/"}});
  emitter.job_submitted("MD_rdm", "1234", "lsf");
  emitter.run_end(true, "ok");

  auto events = parse_lines(out.str());
  REQUIRE(events.size() == 5);
  for (const auto &e : events) {
    REQUIRE(e["run_id"] == "run42");
    REQUIRE(e.contains("ts"));
  }
  REQUIRE(events[0]["type"] == "run_start");
  REQUIRE(events[0]["tbss_dir"] == "/tmp/x");
  REQUIRE(events[1]["stage_name"] == "COPY");
  REQUIRE(events[1]["measure"] == "MD");
  REQUIRE(events[2]["status"] == "skipped");
  REQUIRE(events[2]["marker"] == "/tmp/x/MD/");
  REQUIRE(events[3]["job_id"] == "1234");
  REQUIRE(events[4]["success"] == true);
}

TEST_CASE("event_timestamp_is_iso8601_utc") {
  std::ostringstream out;
  core::EventEmitter emitter("r", out);
  emitter.warning("w");

  auto events = parse_lines(out.str());
  const auto ts = events.at(0)["ts"].get<std::string>();
  REQUIRE(ts.size() == 24);
  REQUIRE(ts[10] == 'T');
  REQUIRE(ts.back() == 'Z');
}
