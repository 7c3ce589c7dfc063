#include "sync_config.hpp"

#include <algorithm>
#include <sstream>

#include "errors.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::unordered_set<std::string> split_ids(const std::string& value) {
  std::unordered_set<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while(std::getline(ss, item, ',')) {
    item = trim_copy(item);
    if(!item.empty()) out.insert(item);
  }
  return out;
}

std::size_t positive_setting(const SettingsManager& settings, const std::string& key, int minimum) {
  int value = settings.get<int>(key);
  if(value < minimum) {
    throw ConfigError(key + " must be >= " + std::to_string(minimum) + " (got " + std::to_string(value) + ")");
  }
  return static_cast<std::size_t>(value);
}

std::filesystem::path resolve(const std::filesystem::path& root, const std::string& value) {
  std::filesystem::path path(value);
  if(path.is_absolute()) return path;
  return root / path;
}

} // namespace

SyncConfig SyncConfig::from_settings(const SettingsManager& settings,
                                     const std::filesystem::path& workspace_root) {
  SyncConfig config;
  config.policy = ExtensionPolicyTable::from_json(settings.raw("extension_policy"));

  auto download_dir = settings.get<std::string>("download_dir");
  if(download_dir.empty()) throw ConfigError("download_dir must not be empty");
  config.download_dir = resolve(workspace_root, download_dir);

  auto index_dir = settings.get<std::string>("index_dir");
  config.index_dir = index_dir.empty()
    ? config.download_dir / ".intern"
    : resolve(workspace_root, index_dir);

  config.max_workers = positive_setting(settings, "max_workers", 1);
  config.worker_count = std::min(positive_setting(settings, "workers", 1), config.max_workers);
  config.queue_capacity = positive_setting(settings, "queue_capacity", 1);

  config.retry.attempts = positive_setting(settings, "retry_attempts", 1);
  config.retry.initial_backoff = std::chrono::milliseconds(positive_setting(settings, "retry_backoff_ms", 0));
  config.retry.max_backoff = std::chrono::milliseconds(positive_setting(settings, "retry_max_backoff_ms", 0));
  config.retry.multiplier = settings.get<double>("retry_backoff_multiplier");
  if(config.retry.multiplier < 1.0) {
    throw ConfigError("retry_backoff_multiplier must be >= 1.0");
  }
  config.request_timeout = std::chrono::milliseconds(positive_setting(settings, "request_timeout_ms", 1));

  config.include_courses = split_ids(settings.get<std::string>("include_courses"));
  config.exclude_courses = split_ids(settings.get<std::string>("exclude_courses"));

  auto log_file = settings.get<std::string>("log_file");
  if(!log_file.empty()) config.log_file = resolve(workspace_root, log_file);
  config.verbose = settings.get<bool>("verbose");
  return config;
}

bool SyncConfig::course_selected(const std::string& course_id) const {
  if(exclude_courses.count(course_id)) return false;
  return include_courses.empty() || include_courses.count(course_id) > 0;
}
