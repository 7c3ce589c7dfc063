#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "job_queue.hpp"
#include "log.hpp"
#include "result_reporter.hpp"
#include "stop_signal.hpp"

struct SyncConfig;
class FingerprintEngine;
class KnownFingerprintIndex;
class LocalFileStore;

enum class JobState { Pending, Fingerprinting, Skipping, Downloading, Completed, Failed };

const char* to_string(JobState state);

// Fixed pool of workers draining a bounded JobQueue. Each worker runs one
// job through fingerprint -> index check -> skip or download before it
// claims the next. Per-job errors end up in the job's result only.
class DownloadScheduler {
public:
  using TransitionObserver = std::function<void(const Job& job, JobState state)>;

  DownloadScheduler(const SyncConfig& config,
                    const FingerprintEngine& engine,
                    KnownFingerprintIndex& index,
                    const LocalFileStore& store,
                    ResultReporter& reporter,
                    std::shared_ptr<Logger> logger = nullptr);
  ~DownloadScheduler();

  DownloadScheduler(const DownloadScheduler&) = delete;
  DownloadScheduler& operator=(const DownloadScheduler&) = delete;

  // Must be set before start(); called from worker threads.
  void set_transition_observer(TransitionObserver observer);

  void start();
  // Blocks while the queue is full. False once the scheduler is stopping.
  bool submit(Job job);
  // No more jobs: let the workers drain the queue, then join them.
  void finish();
  // Idle workers exit, queued jobs are dropped unstarted, in-flight jobs
  // abort with Cancelled unless their download was already committed.
  void request_stop();

  bool stop_requested() const { return stop_.stop_requested(); }
  const StopSignal& stop_signal() const { return stop_; }
  std::size_t worker_count() const { return worker_count_; }
  std::size_t submitted() const { return submitted_.load(); }

private:
  void worker_loop(std::size_t worker_id);
  JobResult process(const Job& job, std::size_t worker_id);
  // First free target for `job` in this run; later claimants get "<stem>.<n><ext>".
  std::filesystem::path claim_target(const Job& job);
  uint64_t download(const Job& job, const std::filesystem::path& target);
  JobResult fail(const Job& job, std::size_t worker_id, FailureKind kind, const std::string& reason);
  void transition(const Job& job, JobState state);
  void join_workers();

  const SyncConfig& config_;
  const FingerprintEngine& engine_;
  KnownFingerprintIndex& index_;
  const LocalFileStore& store_;
  ResultReporter& reporter_;
  std::shared_ptr<Logger> logger_;
  TransitionObserver observer_;

  const std::size_t worker_count_;
  StopSignal stop_;
  JobQueue queue_;
  std::vector<std::thread> workers_;
  std::mutex lifecycle_mutex_;
  bool started_ = false;
  std::atomic<std::size_t> submitted_{0};
  std::mutex targets_mutex_;
  std::unordered_set<std::string> claimed_targets_;
};
