#include "local_store.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "errors.hpp"
#include "utils.hpp"

namespace {

std::string errno_text() {
  return std::strerror(errno);
}

} // namespace

StagedFile::StagedFile(std::filesystem::path target, std::filesystem::path staging)
  : target_(std::move(target)), staging_(std::move(staging)) {
  fd_ = ::open(staging_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if(fd_ == -1) {
    throw StorageError("Cannot create " + staging_.string() + ": " + errno_text());
  }
}

StagedFile::~StagedFile() {
  if(!committed_) discard();
}

void StagedFile::close_fd() {
  if(fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

void StagedFile::write(const char* data, std::size_t size) {
  if(fd_ == -1) throw StorageError("Write to closed file " + staging_.string());
  std::size_t done = 0;
  while(done < size) {
    ssize_t rv = ::write(fd_, data + done, size - done);
    if(rv == -1) {
      if(errno == EINTR) continue;
      throw StorageError("Write to " + staging_.string() + " failed: " + errno_text());
    }
    done += static_cast<std::size_t>(rv);
  }
  written_ += size;
}

void StagedFile::commit() {
  if(committed_) return;
  if(fd_ == -1) throw StorageError("Commit of closed file " + staging_.string());
  if(::fsync(fd_) == -1) {
    throw StorageError("fsync of " + staging_.string() + " failed: " + errno_text());
  }
  if(::close(fd_) == -1) {
    fd_ = -1;
    throw StorageError("close of " + staging_.string() + " failed: " + errno_text());
  }
  fd_ = -1;
  std::error_code ec;
  std::filesystem::rename(staging_, target_, ec);
  if(ec) {
    throw StorageError("Cannot move " + staging_.string() + " to " + target_.string() + ": " + ec.message());
  }
  // make the rename itself durable
  int dir_fd = ::open(target_.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if(dir_fd != -1) {
    ::fsync(dir_fd);
    ::close(dir_fd);
  }
  committed_ = true;
}

void StagedFile::discard() {
  close_fd();
  std::error_code ec;
  std::filesystem::remove(staging_, ec);
}

LocalFileStore::LocalFileStore(std::filesystem::path root)
  : root_(std::move(root)) {}

std::filesystem::path LocalFileStore::course_directory(const Course& course) const {
  const auto& name = course.display_name.empty() ? course.id : course.display_name;
  return root_ / sanitize_name(name);
}

std::filesystem::path LocalFileStore::target_path(const RemoteFileDescriptor& job, std::size_t variant) const {
  auto dir = course_directory(job.course);
  std::string location = job.location;
  std::size_t start = 0;
  while(start <= location.size()) {
    auto slash = location.find('/', start);
    auto part = location.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    if(!part.empty() && part != "." && part != "..") dir /= sanitize_name(part);
    if(slash == std::string::npos) break;
    start = slash + 1;
  }
  std::filesystem::path name = sanitize_name(job.display_name);
  if(variant == 0) return dir / name;
  auto stem = name.stem().string();
  auto ext = name.extension().string();
  return dir / (stem + "." + std::to_string(variant) + ext);
}

std::unique_ptr<StagedFile> LocalFileStore::begin(const std::filesystem::path& target) const {
  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if(ec) {
    throw StorageError("Cannot create " + target.parent_path().string() + ": " + ec.message());
  }
  // unique even when another process stages the same target
  static std::atomic<uint64_t> next_staging_id{1};
  auto staging = target;
  staging += "." + std::to_string(next_staging_id.fetch_add(1)) + ".part";
  return std::make_unique<StagedFile>(target, staging);
}
