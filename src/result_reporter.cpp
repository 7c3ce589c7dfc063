#include "result_reporter.hpp"

#include "utils.hpp"

const char* to_string(JobOutcome outcome) {
  switch(outcome) {
    case JobOutcome::Downloaded: return "downloaded";
    case JobOutcome::SkippedDuplicate: return "skipped";
    case JobOutcome::Failed: return "failed";
  }
  return "unknown";
}

const char* to_string(FailureKind kind) {
  switch(kind) {
    case FailureKind::None: return "none";
    case FailureKind::Fetch: return "fetch";
    case FailureKind::Storage: return "storage";
    case FailureKind::Cancelled: return "cancelled";
  }
  return "unknown";
}

ResultReporter::ResultReporter(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("report")) {}

void ResultReporter::set_listener(Listener listener) {
  std::lock_guard<std::mutex> lock(m_);
  listener_ = std::move(listener);
}

void ResultReporter::record(JobResult result) {
  Listener listener;
  {
    std::lock_guard<std::mutex> lock(m_);
    switch(result.outcome) {
      case JobOutcome::Downloaded:
        ++summary_.downloaded;
        summary_.bytes_downloaded += result.bytes;
        break;
      case JobOutcome::SkippedDuplicate:
        ++summary_.skipped;
        break;
      case JobOutcome::Failed:
        ++summary_.failed;
        if(result.failure == FailureKind::Cancelled) ++summary_.cancelled;
        break;
    }
    results_.push_back(result);
    listener = listener_;
  }
  if(listener) listener(result);
}

void ResultReporter::record_not_started(const std::vector<Job>& jobs) {
  std::lock_guard<std::mutex> lock(m_);
  summary_.not_started += jobs.size();
  not_started_.insert(not_started_.end(), jobs.begin(), jobs.end());
}

ResultReporter::Summary ResultReporter::summary() const {
  std::lock_guard<std::mutex> lock(m_);
  return summary_;
}

std::vector<JobResult> ResultReporter::results() const {
  std::lock_guard<std::mutex> lock(m_);
  return results_;
}

std::vector<JobResult> ResultReporter::failures() const {
  std::lock_guard<std::mutex> lock(m_);
  std::vector<JobResult> out;
  for(const auto& result : results_) {
    if(result.outcome == JobOutcome::Failed) out.push_back(result);
  }
  return out;
}

std::vector<Job> ResultReporter::not_started() const {
  std::lock_guard<std::mutex> lock(m_);
  return not_started_;
}

std::string ResultReporter::summary_line() const {
  auto s = summary();
  std::string line = fmt::format("{} downloaded, {} skipped, {} failed", s.downloaded, s.skipped, s.failed);
  if(s.not_started > 0) {
    line += fmt::format(", {} not started", s.not_started);
  }
  return line;
}

void ResultReporter::print_report() const {
  auto s = summary();
  for(const auto& failure : failures()) {
    logger_->print_err("  failed: {} ({}: {})",
                       failure.job ? failure.job->label() : std::string("<unknown>"),
                       to_string(failure.failure),
                       failure.reason);
  }
  logger_->print("{} ({} transferred)", summary_line(), format_size(s.bytes_downloaded));
  if(s.failed > 0) {
    logger_->print("Re-run to retry the failed files.");
  }
}
