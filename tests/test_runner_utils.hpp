#pragma once

#include "byte_source.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "stop_signal.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace coursesync::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!label.empty()) {
          lines_.emplace_back(label + ": " + message);
        } else {
          lines_.emplace_back(channel + ": " + message);
        }
        cv_.notify_all();
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Fresh directory under the system temp dir, removed again on destruction.
class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name) {
    static std::atomic<int> counter{0};
    root_ = std::filesystem::temp_directory_path() /
            ("coursesync_" + name + "_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter.fetch_add(1)));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_, ec);
  }

  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path operator/(const std::string& child) const { return root_ / child; }

private:
  std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Deterministic pseudo random content; different seeds give different bytes.
inline std::string make_content(std::size_t size, uint32_t seed) {
  std::string out(size, '\0');
  uint32_t state = seed * 2654435761u + 1;
  for(std::size_t i = 0; i < size; ++i) {
    state = state * 1664525u + 1013904223u;
    out[i] = static_cast<char>(state >> 24);
  }
  return out;
}

inline std::size_t count_files_with_suffix(const std::filesystem::path& root, const std::string& suffix) {
  std::size_t count = 0;
  std::error_code ec;
  if(!std::filesystem::exists(root, ec)) return 0;
  for(const auto& entry : std::filesystem::recursive_directory_iterator(root, ec)) {
    auto name = entry.path().filename().string();
    if(name.size() >= suffix.size() &&
       name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
      ++count;
    }
  }
  return count;
}

// Blocks callers until opened; a stop wakes them with CancelledError.
class Gate {
public:
  void open() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  void wait(const StopSignal& stop) {
    entered_.fetch_add(1);
    std::unique_lock<std::mutex> lock(mutex_);
    while(!open_) {
      cv_.wait_for(lock, std::chrono::milliseconds(5));
      if(!open_ && stop.stop_requested()) throw CancelledError();
    }
  }

  std::size_t entered() const { return entered_.load(); }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
  std::atomic<std::size_t> entered_{0};
};

// In-memory remote file with injectable failures.
class MemorySource : public ByteRangeSource {
public:
  explicit MemorySource(std::string content, std::string name = "memory")
    : content_(std::move(content)), name_(std::move(name)) {}

  RangeRead fetch_range(uint64_t offset, std::size_t length, const StopSignal& stop) override {
    range_calls.fetch_add(1);
    stop.throw_if_stopped();
    if(range_failures.load() > 0) {
      range_failures.fetch_sub(1);
      throw FetchError(name_ + ": injected range failure");
    }
    RangeRead out;
    if(report_total) out.total_size = content_.size();
    if(offset >= content_.size()) return out;
    auto count = std::min<uint64_t>(length, content_.size() - offset);
    out.data.assign(content_.begin() + static_cast<std::ptrdiff_t>(offset),
                    content_.begin() + static_cast<std::ptrdiff_t>(offset + count));
    bytes_served.fetch_add(count);
    return out;
  }

  uint64_t fetch_full(const ChunkSink& sink, const StopSignal& stop) override {
    full_calls.fetch_add(1);
    if(full_gate) full_gate->wait(stop);
    stop.throw_if_stopped();
    if(full_failures.load() > 0) {
      full_failures.fetch_sub(1);
      throw FetchError(name_ + ": injected download failure");
    }
    const std::size_t chunk = 4096;
    for(std::size_t pos = 0; pos < content_.size(); pos += chunk) {
      stop.throw_if_stopped();
      auto n = std::min(chunk, content_.size() - pos);
      sink(content_.data() + pos, n);
      bytes_served.fetch_add(n);
    }
    return content_.size();
  }

  std::string describe() const override { return name_; }

  const std::string& content() const { return content_; }

  std::atomic<int> range_failures{0};
  std::atomic<int> full_failures{0};
  std::atomic<int> range_calls{0};
  std::atomic<int> full_calls{0};
  std::atomic<uint64_t> bytes_served{0};
  bool report_total = true;
  std::shared_ptr<Gate> full_gate;

private:
  std::string content_;
  std::string name_;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

#define CS_CHECK(cond)                                                    \
  do {                                                                    \
    if(!(cond)) {                                                         \
      std::cout << "\n    check failed: " #cond " (" << __FILE__ << ":" \
                << __LINE__ << ")\n";                                     \
      return false;                                                       \
    }                                                                     \
  } while(0)

inline int run_tests(const std::string& suite,
                     const std::vector<TestCase>& tests,
                     int argc,
                     char** argv) {
  bool verbose = (std::getenv("COURSESYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("COURSESYNC_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  init(verbose);
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace coursesync::test
