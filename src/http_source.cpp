#include "http_source.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <algorithm>
#include <mutex>
#include <sstream>
#include <vector>

#include "errors.hpp"
#include "stop_signal.hpp"
#include "utils.hpp"

namespace {

using tcp = asio::ip::tcp;
using TlsStream = asio::ssl::stream<tcp::socket>;

constexpr std::chrono::milliseconds kPollInterval{50};
constexpr std::size_t kReadChunk = 64 * 1024;

struct PendingOp {
  bool done = false;
  std::error_code ec;
  std::size_t bytes = 0;

  auto handler() {
    return [this](const std::error_code& error, std::size_t transferred){
      done = true;
      ec = error;
      bytes = transferred;
    };
  }
};

// Drives one asynchronous step to completion on a private io_context while
// watching the stop signal and the step deadline.
struct StepRunner {
  asio::io_context& io;
  const StopSignal& stop;
  std::chrono::milliseconds timeout;
  std::string what;

  void wait(const PendingOp& op, const std::function<void()>& abort) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!op.done) {
      io.restart();
      io.run_for(kPollInterval);
      if(op.done) break;
      const bool cancelled = stop.stop_requested();
      const bool expired = std::chrono::steady_clock::now() >= deadline;
      if(cancelled || expired) {
        abort();
        // let the aborted handler run before its captures go away
        io.restart();
        io.run();
        if(cancelled) throw CancelledError();
        throw FetchError(what + ": timed out after " + std::to_string(timeout.count()) + " ms");
      }
    }
  }
};

asio::ssl::context& tls_context() {
  static std::once_flag once;
  static std::unique_ptr<asio::ssl::context> context;
  std::call_once(once, []{
    context = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
    context->set_default_verify_paths();
  });
  return *context;
}

bool is_redirect(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

bool is_default_port(const HttpUrl& url) {
  return (url.scheme == "http" && url.port == "80") || (url.scheme == "https" && url.port == "443");
}

void close_stream(tcp::socket& socket) {
  std::error_code ignored;
  socket.close(ignored);
}

void close_stream(TlsStream& stream) {
  std::error_code ignored;
  stream.lowest_layer().close(ignored);
}

void handshake(tcp::socket&, const HttpUrl&, bool, const StepRunner&) {}

void handshake(TlsStream& stream, const HttpUrl& url, bool verify_peer, const StepRunner& step) {
  if(!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    throw FetchError(step.what + ": cannot set TLS server name");
  }
  if(verify_peer) {
    stream.set_verify_mode(asio::ssl::verify_peer);
    stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
  } else {
    stream.set_verify_mode(asio::ssl::verify_none);
  }
  PendingOp op;
  stream.async_handshake(asio::ssl::stream_base::client, [&op](const std::error_code& ec){
    op.done = true;
    op.ec = ec;
  });
  step.wait(op, [&]{ close_stream(stream); });
  if(op.ec) throw FetchError(step.what + ": TLS handshake failed: " + op.ec.message());
}

bool is_end_of_stream(const std::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

template<typename Stream>
HttpRangeSource::ResponseHead exchange(Stream& stream,
                                       const StepRunner& step,
                                       const HttpUrl& url,
                                       bool verify_peer,
                                       const std::string& request,
                                       const HttpRangeSource::BodyCallback& on_body) {
  auto abort = [&]{ close_stream(stream); };

  tcp::resolver resolver(step.io);
  tcp::resolver::results_type endpoints;
  {
    PendingOp op;
    resolver.async_resolve(url.host, url.port,
      [&](const std::error_code& ec, tcp::resolver::results_type results){
        op.done = true;
        op.ec = ec;
        endpoints = std::move(results);
      });
    step.wait(op, [&]{ resolver.cancel(); });
    if(op.ec) throw FetchError(step.what + ": resolve failed: " + op.ec.message());
  }
  {
    PendingOp op;
    asio::async_connect(stream.lowest_layer(), endpoints,
      [&op](const std::error_code& ec, const tcp::endpoint&){
        op.done = true;
        op.ec = ec;
      });
    step.wait(op, abort);
    if(op.ec) throw FetchError(step.what + ": connect failed: " + op.ec.message());
  }
  handshake(stream, url, verify_peer, step);
  {
    PendingOp op;
    asio::async_write(stream, asio::buffer(request), op.handler());
    step.wait(op, abort);
    if(op.ec) throw FetchError(step.what + ": sending request failed: " + op.ec.message());
  }

  asio::streambuf buffer;
  HttpRangeSource::ResponseHead head;
  {
    PendingOp op;
    asio::async_read_until(stream, buffer, "\r\n\r\n", op.handler());
    step.wait(op, abort);
    if(op.ec) throw FetchError(step.what + ": reading response failed: " + op.ec.message());
    std::string raw(asio::buffers_begin(buffer.data()),
                    asio::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(op.bytes));
    buffer.consume(op.bytes);
    auto parsed = HttpRangeSource::parse_head(raw);
    if(!parsed) throw FetchError(step.what + ": malformed response head");
    head = std::move(*parsed);
  }

  bool keep_reading = static_cast<bool>(on_body);
  if(keep_reading && buffer.size() > 0) {
    std::string rest(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
    buffer.consume(buffer.size());
    keep_reading = on_body(head, rest.data(), rest.size());
  }
  std::vector<char> chunk(kReadChunk);
  while(keep_reading) {
    PendingOp op;
    stream.async_read_some(asio::buffer(chunk), op.handler());
    step.wait(op, abort);
    if(op.bytes > 0) keep_reading = on_body(head, chunk.data(), op.bytes);
    if(is_end_of_stream(op.ec)) break;
    if(op.ec) throw FetchError(step.what + ": reading body failed: " + op.ec.message());
  }
  close_stream(stream);
  return head;
}

std::optional<uint64_t> parse_u64(const std::string& text) {
  if(text.empty()) return std::nullopt;
  uint64_t value = 0;
  for(char c : text) {
    if(c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  return value;
}

} // namespace

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
  auto scheme_end = url.find("://");
  if(scheme_end == std::string::npos) return std::nullopt;
  HttpUrl out;
  out.scheme = to_lower_copy(url.substr(0, scheme_end));
  if(out.scheme != "http" && out.scheme != "https") return std::nullopt;

  std::string rest = url.substr(scheme_end + 3);
  auto path_start = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, path_start);
  out.target = (path_start == std::string::npos) ? "/" : rest.substr(path_start);
  auto fragment = out.target.find('#');
  if(fragment != std::string::npos) out.target.erase(fragment);
  if(out.target.empty() || out.target.front() != '/') out.target.insert(out.target.begin(), '/');

  auto at = authority.rfind('@');
  if(at != std::string::npos) authority.erase(0, at + 1);

  if(!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if(close == std::string::npos) return std::nullopt;
    out.host = authority.substr(1, close - 1);
    if(close + 1 < authority.size() && authority[close + 1] == ':') {
      out.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    out.host = authority.substr(0, colon);
    if(colon != std::string::npos) out.port = authority.substr(colon + 1);
  }
  if(out.host.empty()) return std::nullopt;
  if(out.port.empty()) out.port = (out.scheme == "https") ? "443" : "80";
  if(!parse_u64(out.port)) return std::nullopt;
  return out;
}

std::optional<HttpUrl> HttpUrl::resolve(const std::string& location) const {
  if(location.find("://") != std::string::npos) return parse(location);
  if(location.rfind("//", 0) == 0) return parse(scheme + ":" + location);
  HttpUrl out = *this;
  if(!location.empty() && location.front() == '/') {
    out.target = location;
    return out;
  }
  std::string base = target.substr(0, target.find('?'));
  base = base.substr(0, base.rfind('/') + 1);
  out.target = base + location;
  return out;
}

std::string HttpUrl::str() const {
  std::string authority = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if(!is_default_port(*this)) authority += ":" + port;
  return scheme + "://" + authority + target;
}

std::optional<std::string> HttpRangeSource::ResponseHead::header(const std::string& name) const {
  auto it = headers.find(to_lower_copy(name));
  if(it == headers.end()) return std::nullopt;
  return it->second;
}

std::optional<HttpRangeSource::ResponseHead> HttpRangeSource::parse_head(const std::string& head) {
  std::istringstream in(head);
  std::string line;
  if(!std::getline(in, line)) return std::nullopt;
  if(!line.empty() && line.back() == '\r') line.pop_back();
  if(line.rfind("HTTP/", 0) != 0) return std::nullopt;
  auto first_space = line.find(' ');
  if(first_space == std::string::npos) return std::nullopt;
  auto code = parse_u64(line.substr(first_space + 1, 3));
  if(!code) return std::nullopt;

  ResponseHead out;
  out.status = static_cast<int>(*code);
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) break;
    auto colon = line.find(':');
    if(colon == std::string::npos) continue;
    out.headers[to_lower_copy(trim_copy(line.substr(0, colon)))] =
      trim_copy(line.substr(colon + 1));
  }
  return out;
}

std::optional<HttpRangeSource::ContentRange> HttpRangeSource::parse_content_range(const std::string& value) {
  std::string text = trim_copy(value);
  if(to_lower_copy(text.substr(0, 6)) != "bytes ") return std::nullopt;
  text = trim_copy(text.substr(6));
  auto slash = text.find('/');
  if(slash == std::string::npos) return std::nullopt;
  std::string span = text.substr(0, slash);
  std::string total = text.substr(slash + 1);

  ContentRange out;
  if(total != "*") {
    out.total = parse_u64(total);
    if(!out.total) return std::nullopt;
  }
  if(span != "*") {
    auto dash = span.find('-');
    if(dash == std::string::npos) return std::nullopt;
    out.first = parse_u64(span.substr(0, dash));
    out.last = parse_u64(span.substr(dash + 1));
    if(!out.first || !out.last || *out.last < *out.first) return std::nullopt;
  }
  return out;
}

HttpRangeSource::HttpRangeSource(const std::string& url)
  : HttpRangeSource(url, Options{}) {}

HttpRangeSource::HttpRangeSource(const std::string& url, Options options)
  : options_(std::move(options)) {
  auto parsed = HttpUrl::parse(url);
  if(!parsed) throw FetchError("Unsupported URL '" + url + "'");
  url_ = std::move(*parsed);
}

std::string HttpRangeSource::describe() const {
  return url_.str();
}

HttpRangeSource::ResponseHead HttpRangeSource::perform(const std::string& range_header,
                                                       const BodyCallback& on_body,
                                                       const StopSignal& stop) {
  HttpUrl current = url_;
  for(std::size_t hop = 0;; ++hop) {
    std::ostringstream request;
    request << "GET " << current.target << " HTTP/1.0\r\n";
    request << "Host: " << current.host;
    if(!is_default_port(current)) request << ":" << current.port;
    request << "\r\n";
    request << "User-Agent: " << options_.user_agent << "\r\n";
    request << "Accept: */*\r\n";
    request << "Accept-Encoding: identity\r\n";
    request << "Connection: close\r\n";
    if(!range_header.empty()) request << "Range: " << range_header << "\r\n";
    // session headers only go to the origin the caller named
    bool same_origin = current.scheme == url_.scheme && current.host == url_.host &&
                       current.port == url_.port;
    if(same_origin) {
      for(const auto& header : options_.headers) {
        request << header.first << ": " << header.second << "\r\n";
      }
    }
    request << "\r\n";

    BodyCallback body = [&](const ResponseHead& head, const char* data, std::size_t size){
      if(is_redirect(head.status)) return false;
      return on_body ? on_body(head, data, size) : false;
    };

    asio::io_context io;
    StepRunner step{io, stop, options_.timeout, current.str()};
    ResponseHead head;
    if(current.scheme == "https") {
      TlsStream stream(io, tls_context());
      head = exchange(stream, step, current, options_.verify_peer, request.str(), body);
    } else {
      tcp::socket socket(io);
      head = exchange(socket, step, current, options_.verify_peer, request.str(), body);
    }

    if(!is_redirect(head.status)) return head;
    auto location = head.header("location");
    if(!location) return head;
    if(hop >= options_.max_redirects) {
      throw FetchError(describe() + ": too many redirects");
    }
    auto next = current.resolve(*location);
    if(!next) throw FetchError(describe() + ": unusable redirect to '" + *location + "'");
    current = std::move(*next);
  }
}

RangeRead HttpRangeSource::fetch_range(uint64_t offset, std::size_t length, const StopSignal& stop) {
  RangeRead out;
  if(length == 0) return out;
  const std::string range = "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);

  auto head = perform(range, [&](const ResponseHead& h, const char* data, std::size_t size){
    if(h.status != 206) return false;
    std::size_t take = std::min(size, length - out.data.size());
    out.data.insert(out.data.end(), data, data + take);
    return out.data.size() < length;
  }, stop);

  std::optional<ContentRange> content_range;
  if(auto value = head.header("content-range")) content_range = parse_content_range(*value);

  if(head.status == 416) {
    // offset is past the end of the resource
    out.data.clear();
    if(content_range) out.total_size = content_range->total;
    return out;
  }
  if(head.status == 200) {
    throw FetchError(describe() + ": server refused partial content");
  }
  if(head.status != 206) {
    throw FetchError(describe() + ": HTTP " + std::to_string(head.status));
  }

  uint64_t expected = length;
  if(content_range) {
    if(content_range->first && *content_range->first != offset) {
      throw FetchError(describe() + ": server answered with a different range");
    }
    out.total_size = content_range->total;
    if(content_range->first && content_range->last) {
      expected = std::min<uint64_t>(expected, *content_range->last - *content_range->first + 1);
    }
  }
  if(out.data.size() < expected) {
    throw FetchError(describe() + ": short range response (" + std::to_string(out.data.size()) +
                     " of " + std::to_string(expected) + " bytes)");
  }
  return out;
}

uint64_t HttpRangeSource::fetch_full(const ChunkSink& sink, const StopSignal& stop) {
  uint64_t received = 0;
  auto head = perform("", [&](const ResponseHead& h, const char* data, std::size_t size){
    if(h.status != 200) return false;
    sink(data, size);
    received += size;
    return true;
  }, stop);

  if(head.status != 200) {
    throw FetchError(describe() + ": HTTP " + std::to_string(head.status));
  }
  if(auto length = head.header("content-length")) {
    auto expected = parse_u64(*length);
    if(expected && received < *expected) {
      throw FetchError(describe() + ": connection closed after " + std::to_string(received) +
                       " of " + std::to_string(*expected) + " bytes");
    }
  }
  return received;
}
