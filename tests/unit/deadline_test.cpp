#include "internal/util/deadline.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace recall;
using namespace std::chrono_literals;

namespace {

bool WaitForIdle(std::chrono::milliseconds limit) {
  const auto until = std::chrono::steady_clock::now() + limit;
  while (util::LiveDeadlineHelpers() != 0) {
    if (std::chrono::steady_clock::now() > until) return false;
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

void TestReturnsResultInTime() {
  assert(util::RunWithTimeout([] { return 42; }, 1000ms, "answer") == 42);
  // Zero timeout runs inline.
  const auto caller = std::this_thread::get_id();
  assert(util::RunWithTimeout([] { return std::this_thread::get_id(); }, 0ms, "inline") == caller);
  assert(WaitForIdle(2000ms));
}

void TestExceptionsPropagate() {
  bool thrown = false;
  try {
    util::RunWithTimeout([]() -> int { throw std::runtime_error("backend said no"); }, 1000ms, "failing");
  } catch (const std::runtime_error& e) {
    thrown = std::string(e.what()) == "backend said no";
  }
  assert(thrown);
  assert(WaitForIdle(2000ms));
}

void TestStuckHelpersAreCapped() {
  auto gate    = std::make_shared<std::promise<void>>();
  auto release = gate->get_future().share();

  for (int i = 0; i < 2; ++i) {
    bool timed_out = false;
    try {
      util::RunWithTimeout([release] { release.wait(); return 1; }, 10ms, "hung call", 2);
    } catch (const util::Timeout&) {
      timed_out = true;
    }
    assert(timed_out);
  }
  assert(util::LiveDeadlineHelpers() == 2);

  // Saturated: fail fast without running the callable.
  std::atomic<bool> ran{false};
  bool              refused = false;
  try {
    util::RunWithTimeout([&ran] { ran = true; return 1; }, 1000ms, "next call", 2);
  } catch (const util::Timeout& e) {
    refused = std::string(e.what()).find("still running") != std::string::npos;
  }
  assert(refused);
  assert(!ran);
  assert(util::LiveDeadlineHelpers() == 2);

  gate->set_value();
  assert(WaitForIdle(2000ms));
  assert(util::RunWithTimeout([] { return 7; }, 1000ms, "recovered", 2) == 7);
}

} // namespace

int main() {
  TestReturnsResultInTime();
  TestExceptionsPropagate();
  TestStuckHelpersAreCapped();
  std::cout << "deadline_test: pass" << std::endl;
  return 0;
}
