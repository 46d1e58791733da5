#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

namespace {
int g_failures = 0;

void check(bool condition, const std::string& message) {
  if (!condition) {
    ++g_failures;
    std::cerr << "[FAIL] " << message << "\n";
  }
}

using namespace std::chrono_literals;

void test_local_stop_ends_worker() {
  fwp::StopSource global_stop;
  fwp::ThreadRunner runner("local");

  std::atomic<int> ticks{0};
  runner.start(global_stop.token(), [&](const fwp::StopToken& stop) {
    while (!stop.stop_requested()) {
      ++ticks;
      stop.wait_for(2ms);
    }
  });

  std::this_thread::sleep_for(20ms);
  check(runner.running(), "worker should be running before stop");

  runner.request_stop();
  runner.join();

  check(!runner.running(), "running flag should drop after the worker returns");
  check(ticks.load() > 0, "worker should have ticked at least once");
  check(!global_stop.stop_requested(), "local stop must not trip the global stop");
}

void test_global_stop_reaches_worker() {
  fwp::StopSource global_stop;
  fwp::ThreadRunner runner("global");

  runner.start(global_stop.token(), [](const fwp::StopToken& stop) {
    while (!stop.stop_requested()) stop.wait_for(2ms);
  });

  global_stop.request_stop();
  runner.join();
  check(runner.stop_requested(), "runner token should report the global stop");
}

void test_double_start_throws() {
  fwp::StopSource global_stop;
  fwp::ThreadRunner runner("double");

  runner.start(global_stop.token(), [](const fwp::StopToken& stop) {
    while (!stop.stop_requested()) stop.wait_for(2ms);
  });

  bool threw = false;
  try {
    runner.start(global_stop.token(), [](const fwp::StopToken&) {});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  check(threw, "starting a runner twice without join should throw");

  runner.request_stop();
  runner.join();

  // Restart after join is allowed, with a fresh local stop
  std::atomic_bool ran{false};
  runner.start(global_stop.token(), [&](const fwp::StopToken&) { ran = true; });
  runner.join();
  check(ran.load(), "runner should restart after join");
}

void test_wait_for_wakes_on_stop() {
  fwp::StopSource src;
  const fwp::StopToken token = src.token();

  std::thread stopper([&] {
    std::this_thread::sleep_for(10ms);
    src.request_stop();
  });

  const auto t0 = std::chrono::steady_clock::now();
  const bool stopped = token.wait_for(5s);
  const auto waited = std::chrono::steady_clock::now() - t0;
  stopper.join();

  check(stopped, "wait_for should report the stop");
  check(waited < 2s, "wait_for should return early on stop");
}

void test_wait_for_times_out() {
  fwp::StopSource src;
  check(!src.token().wait_for(5ms), "wait_for without a stop should time out and return false");

  fwp::StopToken empty;
  check(!empty.wait_for(1ms), "a default token never reports stop");
}

} // namespace

int main() {
  test_local_stop_ends_worker();
  test_global_stop_reaches_worker();
  test_double_start_throws();
  test_wait_for_wakes_on_stop();
  test_wait_for_times_out();

  if (g_failures != 0) {
    std::cerr << g_failures << " thread_runner check(s) failed\n";
    return 1;
  }
  std::cout << "thread_runner_test passed\n";
  return 0;
}
