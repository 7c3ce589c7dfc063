#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>

#include "errors.hpp"
#include "log.hpp"
#include "stop_signal.hpp"

struct RetryPolicy {
  std::size_t attempts = 3;
  std::chrono::milliseconds initial_backoff{500};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{8000};

  std::chrono::milliseconds backoff_for(std::size_t failed_attempts) const {
    double delay = static_cast<double>(initial_backoff.count());
    for(std::size_t i = 1; i < failed_attempts; ++i) delay *= multiplier;
    auto capped = std::min<double>(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
  }
};

// Runs `fn` until it succeeds or `policy.attempts` FetchErrors happened.
// StorageError and CancelledError pass through on the first occurrence; the
// backoff sleep ends early with CancelledError when `stop` fires.
template<typename Fn>
auto with_retries(const RetryPolicy& policy,
                  const StopSignal& stop,
                  Logger* logger,
                  const std::string& what,
                  Fn&& fn) -> decltype(fn()) {
  const std::size_t attempts = std::max<std::size_t>(1, policy.attempts);
  for(std::size_t attempt = 1;; ++attempt) {
    stop.throw_if_stopped();
    try {
      return fn();
    } catch(const FetchError& e) {
      if(attempt >= attempts) throw;
      auto delay = policy.backoff_for(attempt);
      log_debug(logger, "{} failed (attempt {}/{}): {}; retrying in {} ms",
                what, attempt, attempts, e.what(), delay.count());
      if(stop.wait_for(delay)) throw CancelledError();
    }
  }
}
