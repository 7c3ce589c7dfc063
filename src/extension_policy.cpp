#include "extension_policy.hpp"

#include "errors.hpp"
#include "utils.hpp"

namespace {

PolicyWindow parse_window(const std::string& key, const nlohmann::json& value) {
  if(!value.is_array() || value.size() != 2) {
    throw ConfigError("extension_policy entry '" + key + "' must be [skip, read]");
  }
  const auto& skip = value.at(0);
  const auto& read = value.at(1);
  if(!skip.is_number_integer() || !read.is_number_integer()) {
    throw ConfigError("extension_policy entry '" + key + "' must hold integers");
  }
  if(skip.get<int64_t>() < 0) {
    throw ConfigError("extension_policy entry '" + key + "' has a negative skip");
  }
  if(read.get<int64_t>() <= 0) {
    throw ConfigError("extension_policy entry '" + key + "' needs a positive read size");
  }
  PolicyWindow window;
  window.skip_bytes = skip.get<uint64_t>();
  window.read_bytes = read.get<uint64_t>();
  return window;
}

} // namespace

ExtensionPolicyTable::ExtensionPolicyTable()
  : ExtensionPolicyTable(from_json(default_json())) {}

ExtensionPolicyTable::ExtensionPolicyTable(std::unordered_map<std::string, PolicyWindow> entries,
                                           PolicyWindow default_window)
  : default_(default_window) {
  for(auto& entry : entries) {
    entries_.emplace(normalize_extension(entry.first), entry.second);
  }
}

const nlohmann::json& ExtensionPolicyTable::default_json() {
  static const nlohmann::json table = {
    {".pdf",  {0, 8192}},
    {".tex",  {0, 8192}},
    {".zip",  {512, 512}},
    {".docx", {512, 2048}},
    {".pptx", {512, 2048}},
    {".xlsx", {512, 2048}},
    {".mp4",  {4096, 65536}},
    {".mkv",  {4096, 65536}},
    {"*",     {0, 512}}
  };
  return table;
}

ExtensionPolicyTable ExtensionPolicyTable::from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    throw ConfigError("extension_policy must be a JSON object");
  }
  std::unordered_map<std::string, PolicyWindow> entries;
  PolicyWindow fallback;
  for(const auto& item : doc.items()) {
    auto window = parse_window(item.key(), item.value());
    if(item.key() == kDefaultKey) {
      fallback = window;
      continue;
    }
    auto normalized = normalize_extension(item.key());
    if(normalized.size() < 2) {
      throw ConfigError("extension_policy has an empty extension key");
    }
    entries[normalized] = window;
  }
  return ExtensionPolicyTable(std::move(entries), fallback);
}

std::string ExtensionPolicyTable::normalize_extension(const std::string& extension) {
  std::string lowered = to_lower_copy(extension);
  if(lowered.empty() || lowered.front() != '.') lowered.insert(lowered.begin(), '.');
  return lowered;
}

const PolicyWindow& ExtensionPolicyTable::policy_for(const std::string& extension) const {
  if(extension.empty()) return default_;
  auto it = entries_.find(normalize_extension(extension));
  if(it == entries_.end()) return default_;
  return it->second;
}

nlohmann::json ExtensionPolicyTable::to_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& entry : entries_) {
    doc[entry.first] = {entry.second.skip_bytes, entry.second.read_bytes};
  }
  doc[kDefaultKey] = {default_.skip_bytes, default_.read_bytes};
  return doc;
}

// nlohmann::json objects keep their keys sorted, so the dump is stable.
std::string ExtensionPolicyTable::digest() const {
  return sha256_hex(to_json().dump()).substr(0, 16);
}
