#include "tbss_pipeline/exec/fan_out.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

using namespace tbss_pipeline;

TEST_CASE("fan_out_runs_every_task_and_collects_failures") {
  std::atomic<int> ran{0};
  std::vector<exec::FanOutTask> tasks;
  for (int i = 0; i < 6; ++i) {
    tasks.push_back({"s" + std::to_string(i), [i, &ran]() {
                       ++ran;
                       if (i == 1) return 3;
                       if (i == 4) throw std::runtime_error("boom");
                       return 0;
                     }});
  }

  auto report = exec::fan_out(tasks, 0);
  REQUIRE(ran == 6);
  REQUIRE(report.total == 6);
  REQUIRE_FALSE(report.ok());
  REQUIRE(report.failures.size() == 2);
  REQUIRE(report.failures[0].label == "s1");
  REQUIRE(report.failures[0].error == "exit code 3");
  REQUIRE(report.failures[1].label == "s4");
  REQUIRE(report.failures[1].error == "boom");
}

TEST_CASE("fan_out_result_is_independent_of_worker_bound") {
  for (int workers : {0, 1, 2, 8}) {
    std::atomic<int> ran{0};
    std::vector<exec::FanOutTask> tasks;
    for (int i = 0; i < 10; ++i) {
      tasks.push_back({"t" + std::to_string(i), [&ran]() {
                         ++ran;
                         return 0;
                       }});
    }
    auto report = exec::fan_out(tasks, workers);
    REQUIRE(ran == 10);
    REQUIRE(report.ok());
  }
}

TEST_CASE("fan_out_bounds_concurrency") {
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  std::vector<exec::FanOutTask> tasks;
  for (int i = 0; i < 8; ++i) {
    tasks.push_back({"t", [&]() {
                       int now = ++active;
                       int prev = peak.load();
                       while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                       }
                       std::this_thread::sleep_for(std::chrono::milliseconds(10));
                       --active;
                       return 0;
                     }});
  }
  exec::fan_out(tasks, 2);
  REQUIRE(peak.load() <= 2);
}

TEST_CASE("fan_out_starts_tasks_in_input_order_with_one_worker") {
  std::mutex m;
  std::vector<size_t> order;
  std::vector<exec::FanOutTask> tasks;
  for (size_t i = 0; i < 5; ++i) {
    tasks.push_back({"t", [&, i]() {
                       std::lock_guard<std::mutex> lock(m);
                       order.push_back(i);
                       return 0;
                     }});
  }
  exec::fan_out(tasks, 1);
  REQUIRE(order == std::vector<size_t>{0, 1, 2, 3, 4});
}

TEST_CASE("fan_out_reports_each_completion") {
  std::atomic<int> done{0};
  std::atomic<int> failed{0};
  std::atomic<size_t> reported_total{0};
  std::vector<exec::FanOutTask> tasks = {
      {"a", [] { return 0; }}, {"b", [] { return 1; }}, {"c", [] { return 0; }}};
  exec::fan_out(tasks, 0, [&](size_t, size_t total, const std::string &, bool ok) {
    reported_total = total;
    ++done;
    if (!ok) ++failed;
  });
  REQUIRE(reported_total == 3);
  REQUIRE(done == 3);
  REQUIRE(failed == 1);
}

TEST_CASE("fan_out_with_no_tasks_is_ok") {
  auto report = exec::fan_out({}, 4);
  REQUIRE(report.ok());
  REQUIRE(report.total == 0);
}

TEST_CASE("fan_out_finishes_all_tasks_when_workers_cannot_start") {
  for (int started_before_failure : {0, 1, 2}) {
    std::atomic<int> ran{0};
    std::vector<exec::FanOutTask> tasks;
    for (int i = 0; i < 6; ++i) {
      tasks.push_back({"t" + std::to_string(i), [&ran]() {
                         ++ran;
                         return 0;
                       }});
    }

    int spawned = 0;
    auto spawn = [&](std::function<void()> body) {
      if (spawned == started_before_failure) {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
      }
      ++spawned;
      return std::thread(std::move(body));
    };

    auto report = exec::fan_out(tasks, 4, {}, spawn);
    REQUIRE(ran == 6);
    REQUIRE(report.ok());
    REQUIRE(report.total == 6);
  }
}
