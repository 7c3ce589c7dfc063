#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "job.hpp"

struct SyncConfig;

// Enumeration hand-off: the courses and files to sync, as JSON.
//
//   {"courses": [{"id": "42", "name": "Analysis I",
//                 "files": [{"name": "sheet01.pdf",
//                            "url": "https://host/sheet01.pdf",
//                            "size": 1234, "location": "Exercises",
//                            "headers": {"Cookie": "..."}}]}]}
//
// "url" may be http(s)://, file:// or a plain path (relative to the
// manifest's directory).
class Manifest {
public:
  struct FileEntry {
    std::string name;
    std::string url;
    std::optional<uint64_t> size;
    std::string location;
    std::string extension;
    std::map<std::string, std::string> headers;
  };

  struct CourseEntry {
    Course course;
    std::vector<FileEntry> files;
  };

  // Both throw ConfigError.
  static Manifest load(const std::filesystem::path& path);
  static Manifest from_json(const nlohmann::json& doc,
                            std::filesystem::path base_dir = std::filesystem::current_path());

  const std::vector<CourseEntry>& courses() const { return courses_; }
  std::vector<Course> selected_courses(const SyncConfig& config) const;
  std::size_t file_count() const;

  // Hands one job per file of every selected course to `sink` in manifest
  // order and stops early once `sink` returns false. Returns how many jobs
  // were accepted.
  std::size_t enumerate(const SyncConfig& config,
                        const std::function<bool(Job)>& sink) const;

  std::shared_ptr<ByteRangeSource> make_source(const FileEntry& file,
                                               std::chrono::milliseconds timeout) const;

private:
  std::filesystem::path base_dir_;
  std::vector<CourseEntry> courses_;
};
