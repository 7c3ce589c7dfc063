#include "fingerprint_index.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "job.hpp"
#include "utils.hpp"

namespace {

constexpr const char* kIndexSuffix = ".checksums.json";

} // namespace

KnownFingerprintIndex::KnownFingerprintIndex(std::filesystem::path root,
                                             std::string policy_digest,
                                             std::shared_ptr<Logger> logger)
  : root_(std::move(root)),
    policy_digest_(std::move(policy_digest)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("index")) {}

std::filesystem::path KnownFingerprintIndex::path_for(const std::string& course_id) const {
  return root_ / (escape_path_component(course_id) + kIndexSuffix);
}

// An unknown course starts from its persisted set, so a flush never drops
// fingerprints that were written by an earlier run.
KnownFingerprintIndex::CourseEntry& KnownFingerprintIndex::entry_locked(const std::string& course_id) {
  auto it = courses_.find(course_id);
  if(it != courses_.end()) return it->second;
  CourseEntry entry;
  entry.fingerprints = read_persisted(course_id);
  return courses_.emplace(course_id, std::move(entry)).first->second;
}

std::unordered_set<Fingerprint> KnownFingerprintIndex::read_persisted(const std::string& course_id) const {
  std::unordered_set<Fingerprint> out;
  auto path = path_for(course_id);
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return out;

  std::ifstream in(path);
  if(!in) throw StorageError("Cannot open index " + path.string());
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw StorageError("Corrupt index " + path.string() + ": " + e.what());
  }
  try {
    if(!doc.is_object() || !doc.contains("fingerprints") || !doc.at("fingerprints").is_array()) {
      throw StorageError("Corrupt index " + path.string() + ": missing fingerprints");
    }
    auto stored_id = doc.value("course_id", course_id);
    if(stored_id != course_id) {
      throw StorageError("Index " + path.string() + " belongs to course " + stored_id +
                         ", not " + course_id);
    }
    auto stored_policy = doc.value("policy", std::string());
    if(!policy_digest_.empty() && !stored_policy.empty() && stored_policy != policy_digest_) {
      logger_->warn("Index for course {} was built under policy {} but the current policy is {}; "
                    "its fingerprints will not match new ones",
                    course_id, stored_policy, policy_digest_);
    }
    for(const auto& item : doc.at("fingerprints")) {
      std::optional<Fingerprint> fp;
      if(item.is_string()) fp = Fingerprint::from_hex(item.get<std::string>());
      if(!fp) {
        throw StorageError("Corrupt index " + path.string() + ": bad fingerprint entry");
      }
      out.insert(*fp);
    }
  } catch(const nlohmann::json::exception& e) {
    throw StorageError("Corrupt index " + path.string() + ": " + e.what());
  }
  logger_->debug("Loaded {} fingerprints for course {}", out.size(), course_id);
  return out;
}

void KnownFingerprintIndex::load(const Course& course) {
  std::lock_guard lg(m_);
  entry_locked(course.id).display_name = course.display_name;
}

bool KnownFingerprintIndex::loaded(const std::string& course_id) const {
  std::lock_guard lg(m_);
  return courses_.count(course_id) > 0;
}

bool KnownFingerprintIndex::contains(const std::string& course_id, const Fingerprint& fp) const {
  std::lock_guard lg(m_);
  auto it = courses_.find(course_id);
  if(it == courses_.end()) return false;
  return it->second.fingerprints.count(fp) > 0;
}

bool KnownFingerprintIndex::insert(const std::string& course_id, const Fingerprint& fp) {
  std::lock_guard lg(m_);
  auto& entry = entry_locked(course_id);
  if(!entry.fingerprints.insert(fp).second) return false;
  entry.dirty = true;
  flush_locked(course_id, entry);
  return true;
}

std::size_t KnownFingerprintIndex::size(const std::string& course_id) const {
  std::lock_guard lg(m_);
  auto it = courses_.find(course_id);
  return it == courses_.end() ? 0 : it->second.fingerprints.size();
}

void KnownFingerprintIndex::flush(const std::string& course_id) {
  std::lock_guard lg(m_);
  auto it = courses_.find(course_id);
  if(it == courses_.end()) return;
  flush_locked(course_id, it->second);
}

void KnownFingerprintIndex::flush_all() {
  std::lock_guard lg(m_);
  for(auto& entry : courses_) {
    flush_locked(entry.first, entry.second);
  }
}

void KnownFingerprintIndex::flush_locked(const std::string& course_id, CourseEntry& entry) {
  if(!entry.dirty) return;

  std::vector<std::string> hexes;
  hexes.reserve(entry.fingerprints.size());
  for(const auto& fp : entry.fingerprints) hexes.push_back(fp.hex());
  std::sort(hexes.begin(), hexes.end());

  nlohmann::json doc;
  doc["course_id"] = course_id;
  doc["course_name"] = entry.display_name;
  doc["policy"] = policy_digest_;
  doc["fingerprints"] = hexes;

  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if(ec) throw StorageError("Cannot create index directory " + root_.string() + ": " + ec.message());

  auto final_path = path_for(course_id);
  auto temp_path = final_path;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if(!out) throw StorageError("Cannot write index " + temp_path.string());
    out << doc.dump(2);
    out.flush();
    if(!out) throw StorageError("Cannot write index " + temp_path.string());
  }
  std::filesystem::rename(temp_path, final_path, ec);
  if(ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw StorageError("Cannot replace index " + final_path.string() + ": " + ec.message());
  }
  entry.dirty = false;
}

std::size_t KnownFingerprintIndex::rebuild_from_directory(const Course& course,
                                                          const std::filesystem::path& directory,
                                                          const FingerprintEngine& engine) {
  std::error_code ec;
  if(!std::filesystem::is_directory(directory, ec)) return 0;

  std::vector<Fingerprint> found;
  for(auto it = std::filesystem::recursive_directory_iterator(directory, ec);
      !ec && it != std::filesystem::recursive_directory_iterator();
      it.increment(ec)) {
    if(!it->is_regular_file(ec)) continue;
    const auto& path = it->path();
    if(path.extension() == ".part") continue;
    try {
      found.push_back(engine.fingerprint_local(path));
    } catch(const FetchError& e) {
      logger_->warn("Could not fingerprint {}: {}", path.string(), e.what());
    }
  }
  if(ec) {
    logger_->warn("Stopped scanning {}: {}", directory.string(), ec.message());
  }

  std::lock_guard lg(m_);
  auto& entry = entry_locked(course.id);
  if(entry.display_name.empty()) entry.display_name = course.display_name;
  std::size_t added = 0;
  for(const auto& fp : found) {
    if(entry.fingerprints.insert(fp).second) ++added;
  }
  if(added > 0) {
    entry.dirty = true;
    flush_locked(course.id, entry);
  }
  return added;
}
