#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

// The byte window of a file that gets fingerprinted: skip `skip_bytes`,
// then hash the next `read_bytes`.
struct PolicyWindow {
  uint64_t skip_bytes = 0;
  uint64_t read_bytes = 512;

  bool operator==(const PolicyWindow& other) const {
    return skip_bytes == other.skip_bytes && read_bytes == other.read_bytes;
  }
};

// Read-only extension -> window table with a default entry. Built once at
// startup. Fingerprints are only comparable under the same table, so any
// edit makes previously persisted indexes stale.
class ExtensionPolicyTable {
public:
  static constexpr const char* kDefaultKey = "*";

  ExtensionPolicyTable();
  ExtensionPolicyTable(std::unordered_map<std::string, PolicyWindow> entries,
                       PolicyWindow default_window);

  // Accepts {".ext": [skip, read], ..., "*": [skip, read]}. Throws ConfigError.
  static ExtensionPolicyTable from_json(const nlohmann::json& doc);
  static const nlohmann::json& default_json();

  // Unknown extensions resolve to the default window.
  const PolicyWindow& policy_for(const std::string& extension) const;
  const PolicyWindow& default_window() const { return default_; }
  std::size_t size() const { return entries_.size(); }

  nlohmann::json to_json() const;
  // Stable hex digest of the whole table, recorded next to persisted indexes.
  std::string digest() const;

  static std::string normalize_extension(const std::string& extension);

private:
  std::unordered_map<std::string, PolicyWindow> entries_;
  PolicyWindow default_;
};
