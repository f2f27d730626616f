#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "internal/util/errors.hpp"

namespace recall::util {

// Helper threads allowed to be alive at once, timed-out stragglers included.
inline constexpr std::size_t kMaxDeadlineHelpers = 64;

namespace detail {

inline std::atomic<std::size_t>& LiveDeadlineHelpers() {
  static std::atomic<std::size_t> live{0};
  return live;
}

} // namespace detail

// Helper threads started by RunWithTimeout that have not finished yet.
inline std::size_t LiveDeadlineHelpers() {
  return detail::LiveDeadlineHelpers().load();
}

/*
  Runs fn on a helper thread and waits at most `timeout` for it.

  On timeout the helper is detached and keeps running to completion; its
  result is discarded. Callables must therefore own (or share) everything
  they touch. A zero timeout runs fn inline.

  When `max_helpers` helpers are still alive (a hung backend piles them up)
  the call fails with Timeout at once instead of starting another thread.
*/
template <typename Fn>
auto RunWithTimeout(Fn fn, std::chrono::milliseconds timeout, const std::string& what,
                    std::size_t max_helpers = kMaxDeadlineHelpers) -> decltype(fn()) {
  using R = decltype(fn());
  if (timeout.count() <= 0) {
    return fn();
  }

  auto& live = detail::LiveDeadlineHelpers();
  if (live.fetch_add(1) >= max_helpers) {
    live.fetch_sub(1);
    throw Timeout(what + ": " + std::to_string(max_helpers) + " earlier calls still running");
  }

  auto task   = std::make_shared<std::packaged_task<R()>>(std::move(fn));
  auto result = task->get_future();
  try {
    std::thread([task] {
      (*task)();
      detail::LiveDeadlineHelpers().fetch_sub(1);
    }).detach();
  } catch (const std::system_error&) {
    live.fetch_sub(1);
    throw;
  }

  if (result.wait_for(timeout) != std::future_status::ready) {
    throw Timeout(what + ": timed out after " + std::to_string(timeout.count()) + "ms");
  }
  return result.get();
}

} // namespace recall::util
