#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "fingerprint.hpp"
#include "job.hpp"
#include "log.hpp"

enum class JobOutcome { Downloaded, SkippedDuplicate, Failed };
enum class FailureKind { None, Fetch, Storage, Cancelled };

const char* to_string(JobOutcome outcome);
const char* to_string(FailureKind kind);

struct JobResult {
  Job job;
  JobOutcome outcome = JobOutcome::Failed;
  FailureKind failure = FailureKind::None;
  std::string reason;
  std::optional<Fingerprint> fingerprint;
  uint64_t bytes = 0;
  std::size_t worker_id = 0;
};

// Collects results in whatever order workers finish them.
class ResultReporter {
public:
  using Listener = std::function<void(const JobResult&)>;

  struct Summary {
    std::size_t downloaded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;   // subset of failed
    std::size_t not_started = 0;
    uint64_t bytes_downloaded = 0;

    std::size_t completed() const { return downloaded + skipped; }
    std::size_t total() const { return downloaded + skipped + failed; }
  };

  explicit ResultReporter(std::shared_ptr<Logger> logger = nullptr);

  void set_listener(Listener listener);
  void record(JobResult result);
  // Jobs dropped from the queue by a stop without ever being claimed.
  void record_not_started(const std::vector<Job>& jobs);

  Summary summary() const;
  std::vector<JobResult> results() const;
  std::vector<JobResult> failures() const;
  std::vector<Job> not_started() const;

  // "N downloaded, M skipped, K failed"
  std::string summary_line() const;
  void print_report() const;

private:
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  Listener listener_;
  Summary summary_;
  std::vector<JobResult> results_;
  std::vector<Job> not_started_;
};
