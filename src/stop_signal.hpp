#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "errors.hpp"

// Global cooperative stop flag shared by the scheduler, its workers and the
// byte sources they drive. Sleeping on it wakes up as soon as a stop lands.
class StopSignal {
public:
  void request_stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool stop_requested() const {
    return stopped_.load(std::memory_order_acquire);
  }

  void throw_if_stopped() const {
    if(stop_requested()) throw CancelledError();
  }

  // Returns true when woken by a stop, false when the full duration elapsed.
  template<typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this]{ return stop_requested(); });
  }

  static const StopSignal& never() {
    static const StopSignal signal;
    return signal;
  }

private:
  std::atomic<bool> stopped_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};
