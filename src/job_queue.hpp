#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

#include "job.hpp"

// Bounded multi-consumer queue between enumeration and the workers. Every
// pushed job is popped by at most one consumer.
class JobQueue {
public:
  explicit JobQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  // Blocks while the queue is full. False once the queue was closed.
  // `on_queued` runs under the lock once the job is in, before any pop sees it.
  bool push(Job job, const std::function<void(const Job&)>& on_queued = nullptr) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [&]{ return closed_ || jobs_.size() < capacity_; });
    if(closed_) return false;
    jobs_.push_back(std::move(job));
    if(on_queued) on_queued(jobs_.back());
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Blocks until a job is available. Empty once closed and drained.
  std::optional<Job> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [&]{ return closed_ || !jobs_.empty(); });
    if(jobs_.empty()) return std::nullopt;
    Job job = std::move(jobs_.front());
    jobs_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return job;
  }

  // No more pushes; consumers drain what is left, then see an empty pop.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Closes and takes every job nobody has claimed yet.
  std::vector<Job> close_and_drain() {
    std::vector<Job> remaining;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      remaining.assign(std::make_move_iterator(jobs_.begin()),
                       std::make_move_iterator(jobs_.end()));
      jobs_.clear();
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    return remaining;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
  }

  std::size_t capacity() const { return capacity_; }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Job> jobs_;
  bool closed_ = false;
};
