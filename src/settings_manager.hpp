#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "extension_policy.hpp"

// key, aliases, type, default, description, persistent
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","manifest"},                 {"aliases", {"m"}},                    {"type","string"}, {"default",""},           {"description","Enumeration manifest (JSON) listing courses and files"}, {"persistent", false}},
  {{"key","download_dir"},             {"aliases", {"d","dir"}},              {"type","string"}, {"default","courses"},    {"description","Directory downloaded files are saved to"}, {"persistent", true}},
  {{"key","index_dir"},                {"aliases", {"idx"}},                  {"type","string"}, {"default",""},           {"description","Directory for per-course fingerprint indexes (default <download_dir>/.intern)"}, {"persistent", true}},
  {{"key","workers"},                  {"aliases", {"n","num_threads"}},      {"type","int"},    {"default",6},            {"description","Number of download workers"}, {"persistent", true}},
  {{"key","max_workers"},              {"aliases", {"mw"}},                   {"type","int"},    {"default",32},           {"description","Upper bound for the worker count"}, {"persistent", true}},
  {{"key","queue_capacity"},           {"aliases", {"qc"}},                   {"type","int"},    {"default",64},           {"description","Jobs buffered between enumeration and workers"}, {"persistent", true}},
  {{"key","retry_attempts"},           {"aliases", {"ra","tries"}},           {"type","int"},    {"default",3},            {"description","Attempts per network operation"}, {"persistent", true}},
  {{"key","retry_backoff_ms"},         {"aliases", {"rb"}},                   {"type","int"},    {"default",500},          {"description","Delay before the first retry"}, {"persistent", true}},
  {{"key","retry_backoff_multiplier"}, {"aliases", {"rbm"}},                  {"type","float"},  {"default",2.0},          {"description","Backoff growth factor per failed attempt"}, {"persistent", true}},
  {{"key","retry_max_backoff_ms"},     {"aliases", {"rmb"}},                  {"type","int"},    {"default",8000},         {"description","Upper bound for a single backoff delay"}, {"persistent", true}},
  {{"key","request_timeout_ms"},       {"aliases", {"timeout","t"}},          {"type","int"},    {"default",30000},        {"description","Deadline for one HTTP request without progress"}, {"persistent", true}},
  {{"key","extension_policy"},         {"aliases", {"policy"}},               {"type","json"},   {"default",ExtensionPolicyTable::default_json()}, {"description","Fingerprint windows: {\".ext\": [skip, read], \"*\": [skip, read]}"}, {"persistent", true}},
  {{"key","include_courses"},          {"aliases", {"w","whitelist"}},        {"type","string"}, {"default",""},           {"description","Comma separated course ids to sync (empty = all)"}, {"persistent", true}},
  {{"key","exclude_courses"},          {"aliases", {"b","blacklist"}},        {"type","string"}, {"default",""},           {"description","Comma separated course ids to skip (wins over include)"}, {"persistent", true}},
  {{"key","rebuild_index"},            {"aliases", {"rebuild"}},              {"type","bool"},   {"default",false},        {"description","Rebuild indexes from already downloaded files and exit"}, {"persistent", false}},
  {{"key","log_file"},                 {"aliases", {"log"}},                  {"type","string"}, {"default",""},           {"description","Append log lines to this file"}, {"persistent", true}},
  {{"key","verbose"},                  {"aliases", {"v"}},                    {"type","bool"},   {"default",false},        {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                     {"aliases", {"h","?"}},                {"type","bool"},   {"default",false},        {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                     {"aliases", {"persist"}},              {"type","bool"},   {"default",false},        {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!has(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return settings_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return settings_.contains(key); }
  const nlohmann::json& raw(const std::string& key) const { return settings_.at(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::string value_as_string(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json persistent_json() const;
  const nlohmann::json& specification() const { return specification_; }

  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  const SettingSpec* find_spec(const std::string& token) const;
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  std::vector<SettingSpec> specs_;
  nlohmann::json settings_;
  std::filesystem::path settings_path_override_;
};
