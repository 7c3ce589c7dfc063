#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "fingerprint.hpp"
#include "log.hpp"

struct Course;

// Per-course set of fingerprints whose content was confirmed on disk,
// persisted as <root>/<escaped course-id>.checksums.json. One lock guards every
// course; each insert rewrites that course's file before returning.
class KnownFingerprintIndex {
public:
  KnownFingerprintIndex(std::filesystem::path root,
                        std::string policy_digest,
                        std::shared_ptr<Logger> logger = nullptr);

  // Reads the persisted set for `course` (a missing file is an empty set).
  // Throws StorageError for unreadable or corrupt files.
  void load(const Course& course);
  bool loaded(const std::string& course_id) const;

  bool contains(const std::string& course_id, const Fingerprint& fp) const;
  // Returns false when `fp` was already known. Throws StorageError when the
  // updated set cannot be read or written; the in-memory insert stays.
  bool insert(const std::string& course_id, const Fingerprint& fp);
  std::size_t size(const std::string& course_id) const;

  void flush(const std::string& course_id);
  void flush_all();

  // Fingerprints every regular file below `directory` into the course's set.
  // Returns the number of newly added fingerprints.
  std::size_t rebuild_from_directory(const Course& course,
                                     const std::filesystem::path& directory,
                                     const FingerprintEngine& engine);

  std::filesystem::path path_for(const std::string& course_id) const;
  const std::filesystem::path& root() const { return root_; }

private:
  struct CourseEntry {
    std::string display_name;
    std::unordered_set<Fingerprint> fingerprints;
    bool dirty = false;
  };

  // Throws StorageError.
  std::unordered_set<Fingerprint> read_persisted(const std::string& course_id) const;
  CourseEntry& entry_locked(const std::string& course_id);
  void flush_locked(const std::string& course_id, CourseEntry& entry);

  std::filesystem::path root_;
  std::string policy_digest_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::unordered_map<std::string, CourseEntry> courses_;
};
