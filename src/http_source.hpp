#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "byte_source.hpp"

struct HttpUrl {
  std::string scheme;  // "http" or "https"
  std::string host;
  std::string port;
  std::string target;  // path plus query, always starting with '/'

  static std::optional<HttpUrl> parse(const std::string& url);
  // Resolves a Location header against this URL.
  std::optional<HttpUrl> resolve(const std::string& location) const;
  std::string str() const;
};

// Remote file reached over HTTP(S) with Range requests. Every call opens a
// fresh connection ("Connection: close"), so one instance is safe to use
// from one worker at a time without shared state.
class HttpRangeSource : public ByteRangeSource {
public:
  struct Options {
    std::chrono::milliseconds timeout{30000};  // per I/O step, not per transfer
    std::size_t max_redirects = 5;
    std::map<std::string, std::string> headers;
    std::string user_agent = "coursesync";
    bool verify_peer = true;
  };

  // Throws FetchError for malformed or unsupported URLs.
  HttpRangeSource(const std::string& url, Options options);
  explicit HttpRangeSource(const std::string& url);

  RangeRead fetch_range(uint64_t offset, std::size_t length, const StopSignal& stop) override;
  uint64_t fetch_full(const ChunkSink& sink, const StopSignal& stop) override;
  std::string describe() const override;

  struct ResponseHead {
    int status = 0;
    std::map<std::string, std::string> headers;  // lower-case names

    std::optional<std::string> header(const std::string& name) const;
  };

  // "bytes 0-99/1234", "bytes */1234", "bytes 0-99/*"
  struct ContentRange {
    std::optional<uint64_t> first;
    std::optional<uint64_t> last;
    std::optional<uint64_t> total;
  };
  static std::optional<ContentRange> parse_content_range(const std::string& value);
  static std::optional<ResponseHead> parse_head(const std::string& head);

  // Receives body bytes of the final (non-redirect) response; returning
  // false stops reading and closes the connection.
  using BodyCallback = std::function<bool(const ResponseHead& head, const char* data, std::size_t size)>;

private:
  ResponseHead perform(const std::string& range_header,
                       const BodyCallback& on_body,
                       const StopSignal& stop);

  HttpUrl url_;
  Options options_;
};
