#include "sync_engine.hpp"

#include <csignal>

#include "download_scheduler.hpp"
#include "errors.hpp"
#include "fingerprint.hpp"
#include "fingerprint_index.hpp"
#include "local_store.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

SyncEngine::SyncEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("sync")),
    reporter_(std::make_unique<ResultReporter>(std::make_shared<Logger>("report"))) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

SyncEngine::~SyncEngine() {
  stop_signal_thread();
  std::lock_guard<std::mutex> lock(scheduler_mutex_);
  scheduler_.reset();
}

void SyncEngine::start() {
  if(started_) return;

  config_ = SyncConfig::from_settings(*settings_, options_.workspace_root);
  init(config_.verbose, config_.log_file);

  engine_ = std::make_unique<FingerprintEngine>(config_.policy);
  index_ = std::make_unique<KnownFingerprintIndex>(config_.index_dir,
                                                   config_.policy.digest(),
                                                   std::make_shared<Logger>("index"));
  store_ = std::make_unique<LocalFileStore>(config_.download_dir);

  logger_->debug("Download dir {}, index dir {}, {} workers, policy {}",
                 config_.download_dir.string(),
                 config_.index_dir.string(),
                 config_.worker_count,
                 config_.policy.digest());

  if(options_.handle_signals) {
    start_signal_thread();
  }
  started_ = true;
}

void SyncEngine::start_signal_thread() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  wait_for_signal();
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SyncEngine::wait_for_signal() {
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    if(stop_requested_.load()) {
      logger_->warn("Already stopping (signal {})", signal_number);
    } else {
      logger_->warn("Received signal {}, stopping", signal_number);
      stop();
    }
    wait_for_signal();
  });
}

void SyncEngine::stop_signal_thread() {
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  signals_.reset();
}

void SyncEngine::stop() {
  stop_requested_.store(true);
  std::lock_guard<std::mutex> lock(scheduler_mutex_);
  if(scheduler_) {
    scheduler_->request_stop();
  }
}

Manifest SyncEngine::load_manifest() const {
  auto value = settings_->get<std::string>("manifest");
  if(value.empty()) {
    throw ConfigError("No manifest given (pass it as the first argument or --manifest)");
  }
  std::filesystem::path path(value);
  if(path.is_relative()) path = options_.workspace_root / path;
  return Manifest::load(path);
}

void SyncEngine::load_indexes(const Manifest& manifest) {
  for(const auto& course : manifest.selected_courses(config_)) {
    index_->load(course);
    logger_->debug("Course {} ({}): {} known files",
                   course.id, course.display_name, index_->size(course.id));
  }
}

ResultReporter::Summary SyncEngine::run() {
  start();
  return run(load_manifest());
}

ResultReporter::Summary SyncEngine::run(const Manifest& manifest) {
  start();
  load_indexes(manifest);

  DownloadScheduler* scheduler = nullptr;
  {
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    scheduler_ = std::make_unique<DownloadScheduler>(config_, *engine_, *index_, *store_, *reporter_,
                                                     std::make_shared<Logger>("scheduler"));
    scheduler = scheduler_.get();
    if(stop_requested_.load()) {
      scheduler->request_stop();
    }
  }

  auto courses = manifest.selected_courses(config_);
  logger_->info("Syncing {} of {} courses with {} workers",
                courses.size(), manifest.courses().size(), scheduler->worker_count());

  std::size_t submitted = manifest.enumerate(config_, [scheduler](Job job){
    return scheduler->submit(std::move(job));
  });
  scheduler->finish();

  try {
    index_->flush_all();
  } catch(const StorageError& e) {
    logger_->error("Unable to persist fingerprint index: {}", e.what());
  }

  auto summary = reporter_->summary();
  logger_->debug("Submitted {} jobs, {} results", submitted, summary.total());
  return summary;
}

std::size_t SyncEngine::rebuild_index() {
  start();
  return rebuild_index(load_manifest());
}

std::size_t SyncEngine::rebuild_index(const Manifest& manifest) {
  start();
  std::size_t added = 0;
  for(const auto& course : manifest.selected_courses(config_)) {
    if(stop_requested_.load()) {
      logger_->warn("Rebuild interrupted");
      break;
    }
    index_->load(course);
    auto directory = store_->course_directory(course);
    auto count = index_->rebuild_from_directory(course, directory, *engine_);
    logger_->info("Course {}: {} new fingerprints from {}", course.id, count, directory.string());
    added += count;
  }
  index_->flush_all();
  return added;
}
