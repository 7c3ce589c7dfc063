#include "download_scheduler.hpp"

#include <algorithm>
#include <exception>

#include "errors.hpp"
#include "fingerprint.hpp"
#include "fingerprint_index.hpp"
#include "local_store.hpp"
#include "retry.hpp"
#include "sync_config.hpp"
#include "utils.hpp"

const char* to_string(JobState state) {
  switch(state) {
    case JobState::Pending: return "pending";
    case JobState::Fingerprinting: return "fingerprinting";
    case JobState::Skipping: return "skipping";
    case JobState::Downloading: return "downloading";
    case JobState::Completed: return "completed";
    case JobState::Failed: return "failed";
  }
  return "unknown";
}

DownloadScheduler::DownloadScheduler(const SyncConfig& config,
                                     const FingerprintEngine& engine,
                                     KnownFingerprintIndex& index,
                                     const LocalFileStore& store,
                                     ResultReporter& reporter,
                                     std::shared_ptr<Logger> logger)
  : config_(config),
    engine_(engine),
    index_(index),
    store_(store),
    reporter_(reporter),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("scheduler")),
    worker_count_(std::max<std::size_t>(1, std::min(config.worker_count, config.max_workers))),
    queue_(config.queue_capacity) {}

DownloadScheduler::~DownloadScheduler() {
  bool running = false;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    running = started_ && !workers_.empty();
  }
  if(running) request_stop();
  join_workers();
}

void DownloadScheduler::set_transition_observer(TransitionObserver observer) {
  observer_ = std::move(observer);
}

void DownloadScheduler::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if(started_) return;
  started_ = true;
  logger_->debug("Starting {} workers (queue capacity {})", worker_count_, queue_.capacity());
  workers_.reserve(worker_count_);
  for(std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back(&DownloadScheduler::worker_loop, this, i);
  }
}

bool DownloadScheduler::submit(Job job) {
  if(!job) return false;
  start();
  if(stop_.stop_requested()) return false;
  // observed under the queue lock, so no worker can report on it first
  bool queued = queue_.push(job, [this](const Job& queued_job){
    transition(queued_job, JobState::Pending);
  });
  if(!queued) return false;
  submitted_.fetch_add(1);
  return true;
}

void DownloadScheduler::finish() {
  queue_.close();
  join_workers();
}

void DownloadScheduler::request_stop() {
  if(stop_.stop_requested()) return;
  logger_->warn("Stop requested; abandoning in-flight downloads");
  stop_.request_stop();
  auto dropped = queue_.close_and_drain();
  if(!dropped.empty()) {
    logger_->info("{} queued files were not started", dropped.size());
    reporter_.record_not_started(dropped);
  }
}

void DownloadScheduler::join_workers() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    threads.swap(workers_);
  }
  for(auto& thread : threads) {
    if(thread.joinable()) thread.join();
  }
}

void DownloadScheduler::transition(const Job& job, JobState state) {
  if(observer_) observer_(job, state);
}

void DownloadScheduler::worker_loop(std::size_t worker_id) {
  while(true) {
    auto job = queue_.pop();
    if(!job) break;
    reporter_.record(process(*job, worker_id));
  }
  logger_->debug("Worker {} exiting", worker_id);
}

JobResult DownloadScheduler::fail(const Job& job,
                                  std::size_t worker_id,
                                  FailureKind kind,
                                  const std::string& reason) {
  if(kind == FailureKind::Cancelled) {
    logger_->info("Cancelled {}", job->label());
  } else {
    logger_->warn("Failed {} ({}): {}", job->label(), to_string(kind), reason);
  }
  transition(job, JobState::Failed);
  JobResult result;
  result.job = job;
  result.outcome = JobOutcome::Failed;
  result.failure = kind;
  result.reason = reason;
  result.worker_id = worker_id;
  return result;
}

std::filesystem::path DownloadScheduler::claim_target(const Job& job) {
  std::lock_guard<std::mutex> lock(targets_mutex_);
  for(std::size_t variant = 0;; ++variant) {
    auto target = store_.target_path(*job, variant);
    if(claimed_targets_.insert(target.string()).second) {
      if(variant > 0) {
        logger_->info("{} shares its path with another file; saving as {}",
                      job->label(), target.filename().string());
      }
      return target;
    }
  }
}

uint64_t DownloadScheduler::download(const Job& job, const std::filesystem::path& target) {
  auto staged = store_.begin(target);
  uint64_t received = job->source->fetch_full(
    [&staged](const char* data, std::size_t size){ staged->write(data, size); },
    stop_);
  if(job->declared_size && *job->declared_size != received) {
    logger_->debug("{}: declared size {} but received {} bytes",
                   job->label(), *job->declared_size, received);
  }
  // last point where a stop still discards the download
  stop_.throw_if_stopped();
  staged->commit();
  return received;
}

JobResult DownloadScheduler::process(const Job& job, std::size_t worker_id) {
  Logger* log = logger_.get();
  transition(job, JobState::Fingerprinting);

  Fingerprint fp;
  try {
    fp = with_retries(config_.retry, stop_, log, "Fingerprint of " + job->label(), [&]{
      return engine_.fingerprint(*job->source, job->extension, stop_);
    });
  } catch(const CancelledError&) {
    return fail(job, worker_id, FailureKind::Cancelled, "Cancelled");
  } catch(const FetchError& e) {
    return fail(job, worker_id, FailureKind::Fetch, e.what());
  } catch(const std::exception& e) {
    return fail(job, worker_id, FailureKind::Fetch, e.what());
  }

  JobResult result;
  result.job = job;
  result.fingerprint = fp;
  result.worker_id = worker_id;

  if(index_.contains(job->course.id, fp)) {
    transition(job, JobState::Skipping);
    logger_->debug("Skipping {} (already have {})", job->label(), fp.hex().substr(0, 12));
    transition(job, JobState::Completed);
    result.outcome = JobOutcome::SkippedDuplicate;
    return result;
  }

  if(stop_.stop_requested()) {
    return fail(job, worker_id, FailureKind::Cancelled, "Cancelled");
  }

  transition(job, JobState::Downloading);
  auto target = claim_target(job);
  try {
    result.bytes = with_retries(config_.retry, stop_, log, "Download of " + job->label(), [&]{
      return download(job, target);
    });
  } catch(const CancelledError&) {
    return fail(job, worker_id, FailureKind::Cancelled, "Cancelled");
  } catch(const StorageError& e) {
    return fail(job, worker_id, FailureKind::Storage, e.what());
  } catch(const FetchError& e) {
    return fail(job, worker_id, FailureKind::Fetch, e.what());
  } catch(const std::exception& e) {
    return fail(job, worker_id, FailureKind::Fetch, e.what());
  }

  // The file is durably on disk; only now may the index learn about it.
  try {
    index_.insert(job->course.id, fp);
  } catch(const StorageError& e) {
    return fail(job, worker_id, FailureKind::Storage, std::string("Index update failed: ") + e.what());
  }

  logger_->info("Downloaded {} ({})", job->label(), format_size(result.bytes));
  transition(job, JobState::Completed);
  result.outcome = JobOutcome::Downloaded;
  return result;
}
