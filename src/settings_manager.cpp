#include "settings_manager.hpp"

#include <algorithm>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specification_(specification),
    settings_(nlohmann::json::object()) {
  for(const auto& entry : specification_) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        spec.aliases.push_back(to_lower_copy(alias.get<std::string>()));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
    settings_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower_copy(token);
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  for(const auto& spec : specs_) {
    if(lowered == spec.key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) { settings_[spec.key] = value.get<bool>(); return true; }
    if(value.is_number_integer()) { settings_[spec.key] = value.get<int>() != 0; return true; }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) { settings_[spec.key] = value.get<int>(); return true; }
    error = "expected integer";
    return false;
  }
  if(spec.type == "float") {
    if(value.is_number()) { settings_[spec.key] = value.get<double>(); return true; }
    error = "expected number";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) { settings_[spec.key] = value.get<std::string>(); return true; }
    error = "expected string";
    return false;
  }
  if(spec.type == "json") {
    settings_[spec.key] = value;
    return true;
  }
  error = "unknown type";
  return false;
}

nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                   const std::string& value,
                                                   std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  try {
    if(spec.type == "bool") {
      std::string v = to_lower_copy(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
      if(v == "false" || v == "0" || v == "off" || v == "no") return false;
      error = "expected boolean (true|false|on|off)";
      return {};
    }
    if(spec.type == "int") return std::stoi(clean);
    if(spec.type == "float") return std::stod(clean);
    if(spec.type == "string") return clean;
    if(spec.type == "json") return nlohmann::json::parse(clean);
  } catch(const std::exception& e) {
    error = e.what();
    return {};
  }
  error = "unsupported type";
  return {};
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return store(*spec, parsed, error);
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*spec, value, error);
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".coursesync" / "settings.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) return false;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_json().dump(2);
  return static_cast<bool>(out);
}

nlohmann::json SettingsManager::persistent_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(spec.persistent) doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower_copy(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}
