#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>

#include "extension_policy.hpp"
#include "retry.hpp"

class SettingsManager;

// Everything the core needs, fixed at startup and handed around by const
// reference. Nothing in the core reads settings after this is built.
struct SyncConfig {
  ExtensionPolicyTable policy;
  std::filesystem::path download_dir;
  std::filesystem::path index_dir;
  std::size_t worker_count = 6;
  std::size_t max_workers = 32;
  std::size_t queue_capacity = 64;
  RetryPolicy retry;
  std::chrono::milliseconds request_timeout{30000};
  std::unordered_set<std::string> include_courses;
  std::unordered_set<std::string> exclude_courses;
  std::filesystem::path log_file;
  bool verbose = false;

  // Validates and clamps; throws ConfigError.
  static SyncConfig from_settings(const SettingsManager& settings,
                                  const std::filesystem::path& workspace_root);

  bool course_selected(const std::string& course_id) const;
};
