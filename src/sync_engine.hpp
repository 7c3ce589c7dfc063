#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include "result_reporter.hpp"
#include "sync_config.hpp"

class DownloadScheduler;
class FingerprintEngine;
class KnownFingerprintIndex;
class LocalFileStore;
class Logger;
class Manifest;
class SettingsManager;

// Owns one sync run: builds the core from settings, loads the indexes of
// the manifest's courses and streams its files through the scheduler.
class SyncEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // SIGINT/SIGTERM call stop() while the engine is alive.
    bool handle_signals = false;
  };

  SyncEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // Validates settings and builds the components. Throws ConfigError.
  void start();
  // Syncs the configured manifest. Index load failures (StorageError) and a
  // bad manifest (ConfigError) abort before any job runs.
  ResultReporter::Summary run();
  ResultReporter::Summary run(const Manifest& manifest);
  // Re-fingerprints already downloaded files of the manifest's courses.
  // Returns the number of fingerprints added.
  std::size_t rebuild_index();
  std::size_t rebuild_index(const Manifest& manifest);
  // Safe from any thread, including signal handlers run by the engine.
  void stop();

  bool stop_requested() const { return stop_requested_.load(); }
  const SyncConfig& config() const { return config_; }
  const ResultReporter& reporter() const { return *reporter_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  Manifest load_manifest() const;
  void load_indexes(const Manifest& manifest);
  void start_signal_thread();
  void stop_signal_thread();
  void wait_for_signal();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  SyncConfig config_;
  bool started_ = false;

  std::unique_ptr<FingerprintEngine> engine_;
  std::unique_ptr<KnownFingerprintIndex> index_;
  std::unique_ptr<LocalFileStore> store_;
  std::unique_ptr<ResultReporter> reporter_;

  std::mutex scheduler_mutex_;
  std::unique_ptr<DownloadScheduler> scheduler_;
  std::atomic<bool> stop_requested_{false};

  asio::io_context io_;
  std::unique_ptr<asio::signal_set> signals_;
  std::thread io_thread_;
};
