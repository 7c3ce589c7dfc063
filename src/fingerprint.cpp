#include "fingerprint.hpp"

#include <algorithm>
#include <limits>
#include <vector>

#include "byte_source.hpp"
#include "file_source.hpp"
#include "stop_signal.hpp"
#include "utils.hpp"

std::string Fingerprint::hex() const {
  return hex_from_bytes(bytes.data(), bytes.size());
}

std::optional<Fingerprint> Fingerprint::from_hex(const std::string& hex) {
  std::vector<unsigned char> raw;
  if(!bytes_from_hex(hex, raw) || raw.size() != kSize) return std::nullopt;
  Fingerprint fp;
  std::copy(raw.begin(), raw.end(), fp.bytes.begin());
  return fp;
}

Fingerprint Fingerprint::of(const char* data, std::size_t size) {
  auto digest = sha256_bytes(data, size);
  Fingerprint fp;
  std::copy(digest.begin(), digest.end(), fp.bytes.begin());
  return fp;
}

FingerprintEngine::FingerprintEngine(const ExtensionPolicyTable& policy)
  : policy_(policy) {}

Fingerprint FingerprintEngine::fingerprint(ByteRangeSource& source, const std::string& extension) const {
  return fingerprint(source, extension, StopSignal::never());
}

Fingerprint FingerprintEngine::fingerprint(ByteRangeSource& source,
                                           const std::string& extension,
                                           const StopSignal& stop) const {
  const auto& window = policy_.policy_for(extension);
  const auto read = static_cast<std::size_t>(
    std::min<uint64_t>(window.read_bytes, std::numeric_limits<std::size_t>::max()));

  auto first = source.fetch_range(window.skip_bytes, read, stop);
  bool short_resource = first.data.size() < read;
  if(first.total_size && *first.total_size < window.skip_bytes + window.read_bytes) {
    short_resource = true;
  }
  if(!short_resource) {
    return Fingerprint::of(first.data.data(), first.data.size());
  }

  // Too short for the configured window: hash what exists from offset 0.
  if(window.skip_bytes == 0) {
    return Fingerprint::of(first.data.data(), first.data.size());
  }
  std::size_t fallback_length = read;
  if(first.total_size) {
    fallback_length = static_cast<std::size_t>(std::min<uint64_t>(read, *first.total_size));
  }
  auto fallback = source.fetch_range(0, fallback_length, stop);
  if(fallback.data.size() > fallback_length) fallback.data.resize(fallback_length);
  return Fingerprint::of(fallback.data.data(), fallback.data.size());
}

Fingerprint FingerprintEngine::fingerprint_local(const std::filesystem::path& path) const {
  LocalFileSource source(path);
  return fingerprint(source, extension_of(path.filename().string()));
}
