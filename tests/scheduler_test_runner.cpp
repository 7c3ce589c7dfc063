#include "download_scheduler.hpp"
#include "errors.hpp"
#include "extension_policy.hpp"
#include "fingerprint.hpp"
#include "fingerprint_index.hpp"
#include "job_queue.hpp"
#include "local_store.hpp"
#include "result_reporter.hpp"
#include "sync_config.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace coursesync::test;
using namespace std::chrono_literals;

namespace {

const Course kCourse{"4711", "Signals"};

SyncConfig test_config(const TempWorkspace& ws, std::size_t workers) {
  SyncConfig config;
  config.download_dir = ws / "courses";
  config.index_dir = ws / "index";
  config.worker_count = workers;
  config.max_workers = 32;
  config.queue_capacity = 16;
  config.retry.attempts = 3;
  config.retry.initial_backoff = 1ms;
  config.retry.max_backoff = 5ms;
  return config;
}

// One sync run: index, store, reporter and scheduler over a config.
struct Harness {
  Harness(TestContext& ctx, const SyncConfig& cfg)
    : config(cfg),
      engine(config.policy),
      index(config.index_dir, config.policy.digest()),
      store(config.download_dir),
      logger(std::make_shared<Logger>("scheduler")),
      scheduler(config, engine, index, store, reporter, logger) {
    ctx.logs.attach(logger);
    index.load(kCourse);
    scheduler.set_transition_observer([this](const Job& job, JobState state){
      std::lock_guard<std::mutex> lock(m);
      transitions[job->display_name].push_back(state);
    });
  }

  std::size_t count_state(JobState state) {
    std::lock_guard<std::mutex> lock(m);
    std::size_t n = 0;
    for(const auto& entry : transitions) {
      for(auto s : entry.second) if(s == state) ++n;
    }
    return n;
  }

  SyncConfig config;
  FingerprintEngine engine;
  KnownFingerprintIndex index;
  LocalFileStore store;
  ResultReporter reporter;
  std::shared_ptr<Logger> logger;
  DownloadScheduler scheduler;
  std::mutex m;
  std::map<std::string, std::vector<JobState>> transitions;
};

std::shared_ptr<MemorySource> source_for(const std::string& content) {
  return std::make_shared<MemorySource>(content);
}

bool test_downloads_new_files(TestContext& ctx) {
  TempWorkspace ws("sched_download");
  Harness h(ctx, test_config(ws, 2));
  std::vector<std::string> contents;
  for(int i = 0; i < 5; ++i) {
    contents.push_back(make_content(3000 + static_cast<std::size_t>(i) * 100, static_cast<uint32_t>(i + 1)));
    CS_CHECK(h.scheduler.submit(make_job(kCourse, "file" + std::to_string(i) + ".pdf",
                                         source_for(contents.back()), std::nullopt, "Lectures")));
  }
  h.scheduler.finish();

  auto summary = h.reporter.summary();
  CS_CHECK(summary.downloaded == 5);
  CS_CHECK(summary.failed == 0);
  CS_CHECK(h.reporter.summary_line() == "5 downloaded, 0 skipped, 0 failed");
  for(int i = 0; i < 5; ++i) {
    auto path = ws / "courses" / "Signals" / "Lectures" / ("file" + std::to_string(i) + ".pdf");
    CS_CHECK(read_file(path) == contents[static_cast<std::size_t>(i)]);
  }
  CS_CHECK(h.index.size(kCourse.id) == 5);
  CS_CHECK(count_files_with_suffix(ws.root(), ".part") == 0);

  std::lock_guard<std::mutex> lock(h.m);
  for(const auto& entry : h.transitions) {
    std::vector<JobState> expected = {JobState::Pending, JobState::Fingerprinting,
                                      JobState::Downloading, JobState::Completed};
    CS_CHECK(entry.second == expected);
  }
  return true;
}

bool test_duplicate_content_is_skipped(TestContext& ctx) {
  TempWorkspace ws("sched_dedup");
  Harness h(ctx, test_config(ws, 1));
  auto content = make_content(10000, 42);
  auto first = source_for(content);
  auto second = source_for(content);
  h.scheduler.submit(make_job(kCourse, "slides.pdf", first));
  h.scheduler.submit(make_job(kCourse, "slides (copy).pdf", second));
  h.scheduler.finish();

  auto summary = h.reporter.summary();
  CS_CHECK(summary.downloaded == 1);
  CS_CHECK(summary.skipped == 1);
  CS_CHECK(first->full_calls.load() == 1);
  CS_CHECK(second->full_calls.load() == 0);
  CS_CHECK(!std::filesystem::exists(ws / "courses" / "Signals" / "slides (copy).pdf"));

  std::lock_guard<std::mutex> lock(h.m);
  std::vector<JobState> skipped = {JobState::Pending, JobState::Fingerprinting,
                                   JobState::Skipping, JobState::Completed};
  CS_CHECK(h.transitions["slides (copy).pdf"] == skipped);
  return true;
}

bool test_changed_header_is_still_a_duplicate(TestContext& ctx) {
  TempWorkspace ws("sched_header");
  auto config = test_config(ws, 1);
  config.policy = ExtensionPolicyTable::from_json({{".pdf", {128, 1024}}, {"*", {0, 64}}});
  Harness h(ctx, config);
  auto original = make_content(3000, 21);
  auto regenerated = original;
  for(std::size_t i = 0; i < 128; ++i) regenerated[i] = static_cast<char>(i);
  auto first = source_for(original);
  auto second = source_for(regenerated);
  h.scheduler.submit(make_job(kCourse, "exam.pdf", first));
  h.scheduler.submit(make_job(kCourse, "exam-export.pdf", second));
  h.scheduler.finish();

  auto summary = h.reporter.summary();
  CS_CHECK(summary.downloaded == 1);
  CS_CHECK(summary.skipped == 1);
  CS_CHECK(second->full_calls.load() == 0);
  CS_CHECK(second->bytes_served.load() == 1024);
  return true;
}

bool test_rerun_downloads_nothing(TestContext& ctx) {
  TempWorkspace ws("sched_rerun");
  std::vector<std::string> contents;
  for(int i = 0; i < 6; ++i) contents.push_back(make_content(2048, static_cast<uint32_t>(100 + i)));

  auto run = [&](std::size_t& downloading, ResultReporter::Summary& summary){
    Harness h(ctx, test_config(ws, 3));
    for(std::size_t i = 0; i < contents.size(); ++i) {
      h.scheduler.submit(make_job(kCourse, "f" + std::to_string(i) + ".txt", source_for(contents[i])));
    }
    h.scheduler.finish();
    downloading = h.count_state(JobState::Downloading);
    summary = h.reporter.summary();
  };

  std::size_t downloading = 0;
  ResultReporter::Summary summary;
  run(downloading, summary);
  CS_CHECK(downloading == 6);
  CS_CHECK(summary.downloaded == 6);

  run(downloading, summary);
  CS_CHECK(downloading == 0);
  CS_CHECK(summary.skipped == 6);
  CS_CHECK(summary.downloaded == 0);
  return true;
}

bool test_each_job_claimed_once(TestContext& ctx) {
  TempWorkspace ws("sched_claims");
  auto config = test_config(ws, 4);
  config.queue_capacity = 8;
  Harness h(ctx, config);

  const int jobs = 200;
  for(int i = 0; i < jobs; ++i) {
    h.scheduler.submit(make_job(kCourse, "doc" + std::to_string(i) + ".bin",
                                source_for(make_content(700, static_cast<uint32_t>(i + 1000)))));
  }
  h.scheduler.finish();

  CS_CHECK(h.scheduler.submitted() == static_cast<std::size_t>(jobs));
  CS_CHECK(h.reporter.results().size() == static_cast<std::size_t>(jobs));
  CS_CHECK(h.reporter.summary().downloaded == static_cast<std::size_t>(jobs));
  CS_CHECK(h.count_state(JobState::Fingerprinting) == static_cast<std::size_t>(jobs));

  std::map<std::size_t, int> per_worker;
  for(const auto& result : h.reporter.results()) per_worker[result.worker_id]++;
  CS_CHECK(per_worker.size() <= 4);

  std::lock_guard<std::mutex> lock(h.m);
  CS_CHECK(h.transitions.size() == static_cast<std::size_t>(jobs));
  for(const auto& entry : h.transitions) {
    CS_CHECK(entry.second.size() == 4);
  }
  return true;
}

bool test_transient_failures_are_retried(TestContext& ctx) {
  TempWorkspace ws("sched_retry");
  Harness h(ctx, test_config(ws, 1));
  auto src = source_for(make_content(5000, 7));
  src->range_failures = 2;
  src->full_failures = 2;
  h.scheduler.submit(make_job(kCourse, "flaky.pdf", src));
  h.scheduler.finish();

  auto summary = h.reporter.summary();
  CS_CHECK(summary.downloaded == 1);
  CS_CHECK(src->range_calls.load() == 3);
  CS_CHECK(src->full_calls.load() == 3);
  CS_CHECK(read_file(ws / "courses" / "Signals" / "flaky.pdf") == src->content());
  CS_CHECK(count_files_with_suffix(ws.root(), ".part") == 0);
  return true;
}

bool test_exhausted_retries_fail_the_job(TestContext& ctx) {
  TempWorkspace ws("sched_exhausted");
  Harness h(ctx, test_config(ws, 2));
  auto broken = source_for(make_content(5000, 8));
  broken->full_failures = 100;
  auto fine = source_for(make_content(5000, 9));
  h.scheduler.submit(make_job(kCourse, "broken.pdf", broken));
  h.scheduler.submit(make_job(kCourse, "fine.pdf", fine));
  h.scheduler.finish();

  auto summary = h.reporter.summary();
  CS_CHECK(summary.downloaded == 1);
  CS_CHECK(summary.failed == 1);
  CS_CHECK(broken->full_calls.load() == 3);
  auto failures = h.reporter.failures();
  CS_CHECK(failures.size() == 1);
  CS_CHECK(failures[0].failure == FailureKind::Fetch);
  CS_CHECK(failures[0].job->display_name == "broken.pdf");
  CS_CHECK(failures[0].reason.find("injected") != std::string::npos);
  CS_CHECK(!std::filesystem::exists(ws / "courses" / "Signals" / "broken.pdf"));
  CS_CHECK(count_files_with_suffix(ws.root(), ".part") == 0);
  CS_CHECK(h.index.size(kCourse.id) == 1);
  return true;
}

bool test_storage_failure_is_not_retried(TestContext& ctx) {
  TempWorkspace ws("sched_storage");
  Harness h(ctx, test_config(ws, 1));
  auto src = source_for(make_content(4000, 10));
  auto job = make_job(kCourse, "blocked.pdf", src);
  // a directory squatting on the target makes the final rename fail
  auto target = h.store.target_path(*job);
  write_file(target / "occupied", "x");

  h.scheduler.submit(job);
  h.scheduler.finish();

  auto failures = h.reporter.failures();
  CS_CHECK(failures.size() == 1);
  CS_CHECK(failures[0].failure == FailureKind::Storage);
  CS_CHECK(src->full_calls.load() == 1);
  CS_CHECK(h.index.size(kCourse.id) == 0);
  CS_CHECK(count_files_with_suffix(ws.root(), ".part") == 0);
  return true;
}

bool test_same_path_files_are_both_kept(TestContext& ctx) {
  TempWorkspace ws("sched_same_path");
  auto first = make_content(5000, 31);
  auto second = make_content(5000, 32);
  {
    Harness h(ctx, test_config(ws, 2));
    CS_CHECK(h.scheduler.submit(make_job(kCourse, "sheet.pdf", source_for(first), std::nullopt, "Week 1")));
    CS_CHECK(h.scheduler.submit(make_job(kCourse, "sheet.pdf", source_for(second), std::nullopt, "Week 1/")));
    h.scheduler.finish();
    CS_CHECK(h.reporter.summary().downloaded == 2);
    CS_CHECK(h.index.size(kCourse.id) == 2);
  }

  auto dir = ws / "courses" / "Signals" / "Week 1";
  CS_CHECK(std::filesystem::exists(dir / "sheet.pdf"));
  CS_CHECK(std::filesystem::exists(dir / "sheet.1.pdf"));
  auto a = read_file(dir / "sheet.pdf");
  auto b = read_file(dir / "sheet.1.pdf");
  CS_CHECK((a == first && b == second) || (a == second && b == first));

  Harness rerun(ctx, test_config(ws, 2));
  rerun.scheduler.submit(make_job(kCourse, "sheet.pdf", source_for(first), std::nullopt, "Week 1"));
  rerun.scheduler.submit(make_job(kCourse, "sheet.pdf", source_for(second), std::nullopt, "Week 1"));
  rerun.scheduler.finish();
  CS_CHECK(rerun.reporter.summary().skipped == 2);
  CS_CHECK(count_files_with_suffix(dir, ".pdf") == 2);
  return true;
}

bool test_index_failure_after_commit(TestContext& ctx) {
  TempWorkspace ws("sched_index_failure");
  auto content = make_content(6000, 40);
  std::filesystem::path target;
  {
    Harness h(ctx, test_config(ws, 1));
    // a directory where the index writes its temporary file blocks every flush
    auto blocker = h.index.path_for(kCourse.id);
    blocker += ".tmp";
    write_file(blocker / "occupied", "x");

    auto job = make_job(kCourse, "notes.pdf", source_for(content));
    target = h.store.target_path(*job);
    h.scheduler.submit(job);
    h.scheduler.finish();

    auto failures = h.reporter.failures();
    CS_CHECK(failures.size() == 1);
    CS_CHECK(failures[0].failure == FailureKind::Storage);
    CS_CHECK(h.reporter.summary().downloaded == 0);
    CS_CHECK(read_file(target) == content);
    CS_CHECK(!std::filesystem::exists(h.index.path_for(kCourse.id)));
    std::filesystem::remove_all(blocker);
  }

  Harness rerun(ctx, test_config(ws, 1));
  auto src = source_for(content);
  rerun.scheduler.submit(make_job(kCourse, "notes.pdf", src));
  rerun.scheduler.finish();
  CS_CHECK(rerun.reporter.summary().downloaded == 1);
  CS_CHECK(src->full_calls.load() == 1);
  CS_CHECK(read_file(target) == content);
  CS_CHECK(rerun.index.size(kCourse.id) == 1);
  return true;
}

bool test_refused_submit_is_not_pending(TestContext& ctx) {
  TempWorkspace ws("sched_refused");
  Harness h(ctx, test_config(ws, 1));
  CS_CHECK(h.scheduler.submit(make_job(kCourse, "accepted.pdf", source_for(make_content(500, 50)))));
  h.scheduler.finish();
  CS_CHECK(!h.scheduler.submit(make_job(kCourse, "refused.pdf", source_for("late"))));

  std::lock_guard<std::mutex> lock(h.m);
  CS_CHECK(h.transitions.count("refused.pdf") == 0);
  CS_CHECK(h.transitions["accepted.pdf"].front() == JobState::Pending);
  return true;
}

bool test_stop_cancels_in_flight_and_drops_queue(TestContext& ctx) {
  TempWorkspace ws("sched_cancel");
  Harness h(ctx, test_config(ws, 3));
  auto gate = std::make_shared<Gate>();
  std::vector<std::shared_ptr<MemorySource>> sources;
  for(int i = 0; i < 10; ++i) {
    auto src = source_for(make_content(9000, static_cast<uint32_t>(500 + i)));
    src->full_gate = gate;
    sources.push_back(src);
    CS_CHECK(h.scheduler.submit(make_job(kCourse, "slow" + std::to_string(i) + ".pdf", src)));
  }

  CS_CHECK(wait_for_condition([&]{ return gate->entered() == 3; }, 5000ms));
  std::this_thread::sleep_for(20ms);
  CS_CHECK(gate->entered() == 3);

  h.scheduler.request_stop();
  CS_CHECK(!h.scheduler.submit(make_job(kCourse, "late.pdf", source_for("late"))));
  h.scheduler.finish();
  {
    std::lock_guard<std::mutex> lock(h.m);
    CS_CHECK(h.transitions.count("late.pdf") == 0);
  }

  auto summary = h.reporter.summary();
  CS_CHECK(summary.failed == 3);
  CS_CHECK(summary.cancelled == 3);
  CS_CHECK(summary.not_started == 7);
  CS_CHECK(summary.downloaded == 0);
  for(const auto& failure : h.reporter.failures()) {
    CS_CHECK(failure.failure == FailureKind::Cancelled);
  }
  CS_CHECK(h.reporter.not_started().size() == 7);
  CS_CHECK(h.index.size(kCourse.id) == 0);
  CS_CHECK(count_files_with_suffix(ws.root(), ".part") == 0);
  CS_CHECK(count_files_with_suffix(ws / "courses", ".pdf") == 0);
  return true;
}

bool test_stop_interrupts_backoff(TestContext& ctx) {
  TempWorkspace ws("sched_backoff");
  auto config = test_config(ws, 1);
  config.retry.attempts = 5;
  config.retry.initial_backoff = 10000ms;
  config.retry.max_backoff = 10000ms;
  Harness h(ctx, config);
  auto src = source_for(make_content(1000, 11));
  src->range_failures = 100;
  h.scheduler.submit(make_job(kCourse, "stuck.pdf", src));

  CS_CHECK(wait_for_condition([&]{ return src->range_calls.load() >= 1; }, 5000ms));
  auto started = std::chrono::steady_clock::now();
  h.scheduler.request_stop();
  h.scheduler.finish();
  CS_CHECK(std::chrono::steady_clock::now() - started < 5000ms);

  auto failures = h.reporter.failures();
  CS_CHECK(failures.size() == 1);
  CS_CHECK(failures[0].failure == FailureKind::Cancelled);
  return true;
}

bool test_queue_applies_backpressure(TestContext&) {
  JobQueue queue(2);
  auto src = source_for("x");
  CS_CHECK(queue.push(make_job(kCourse, "a", src)));
  CS_CHECK(queue.push(make_job(kCourse, "b", src)));

  std::atomic<bool> pushed{false};
  std::thread producer([&]{
    queue.push(make_job(kCourse, "c", src));
    pushed = true;
  });
  std::this_thread::sleep_for(50ms);
  bool blocked = !pushed.load();
  auto first = queue.pop();
  bool released = wait_for_condition([&]{ return pushed.load(); }, 2000ms);
  producer.join();

  CS_CHECK(blocked);
  CS_CHECK(released);
  CS_CHECK(first && (*first)->display_name == "a");
  CS_CHECK(queue.size() == 2);

  queue.close();
  CS_CHECK(!queue.push(make_job(kCourse, "d", src)));
  CS_CHECK(queue.pop().has_value());
  CS_CHECK(queue.pop().has_value());
  CS_CHECK(!queue.pop().has_value());
  return true;
}

bool test_worker_count_is_clamped(TestContext& ctx) {
  TempWorkspace ws("sched_clamp");
  auto config = test_config(ws, 50);
  config.max_workers = 4;
  Harness h(ctx, config);
  CS_CHECK(h.scheduler.worker_count() == 4);
  h.scheduler.finish();
  return true;
}

bool test_job_requires_source(TestContext&) {
  try {
    make_job(kCourse, "nothing.pdf", nullptr);
  } catch(const std::invalid_argument&) {
    auto job = make_job(kCourse, "Notes.TeX", source_for("x"));
    CS_CHECK(job->extension == ".tex");
    CS_CHECK(job->label() == "4711/Notes.TeX");
    return true;
  }
  return false;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"downloads_new_files", test_downloads_new_files},
    {"duplicate_content_is_skipped", test_duplicate_content_is_skipped},
    {"changed_header_is_still_a_duplicate", test_changed_header_is_still_a_duplicate},
    {"rerun_downloads_nothing", test_rerun_downloads_nothing},
    {"each_job_claimed_once", test_each_job_claimed_once},
    {"transient_failures_are_retried", test_transient_failures_are_retried},
    {"exhausted_retries_fail_the_job", test_exhausted_retries_fail_the_job},
    {"storage_failure_is_not_retried", test_storage_failure_is_not_retried},
    {"same_path_files_are_both_kept", test_same_path_files_are_both_kept},
    {"index_failure_after_commit", test_index_failure_after_commit},
    {"refused_submit_is_not_pending", test_refused_submit_is_not_pending},
    {"stop_cancels_in_flight_and_drops_queue", test_stop_cancels_in_flight_and_drops_queue},
    {"stop_interrupts_backoff", test_stop_interrupts_backoff},
    {"queue_applies_backpressure", test_queue_applies_backpressure},
    {"worker_count_is_clamped", test_worker_count_is_clamped},
    {"job_requires_source", test_job_requires_source}
  };
  return run_tests("scheduler", tests, argc, argv);
}
