#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "job.hpp"

// A download in progress, written to "<target>.<n>.part". Only commit() makes
// it visible under the target name; dropping an uncommitted file deletes it.
class StagedFile {
public:
  StagedFile(std::filesystem::path target, std::filesystem::path staging);
  ~StagedFile();

  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  // Throws StorageError.
  void write(const char* data, std::size_t size);
  // fsync, close and rename onto the target. Throws StorageError.
  void commit();
  void discard();

  uint64_t bytes_written() const { return written_; }
  const std::filesystem::path& target() const { return target_; }
  const std::filesystem::path& staging() const { return staging_; }

private:
  void close_fd();

  std::filesystem::path target_;
  std::filesystem::path staging_;
  int fd_ = -1;
  uint64_t written_ = 0;
  bool committed_ = false;
};

class LocalFileStore {
public:
  explicit LocalFileStore(std::filesystem::path root);

  // <root>/<course>/<location>/<name>, every component sanitized. A non-zero
  // `variant` names the n-th alternative, "<stem>.<variant><ext>".
  std::filesystem::path target_path(const RemoteFileDescriptor& job, std::size_t variant = 0) const;
  std::filesystem::path course_directory(const Course& course) const;

  // Opens a fresh staging file next to `target`. Throws StorageError.
  std::unique_ptr<StagedFile> begin(const std::filesystem::path& target) const;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
};
