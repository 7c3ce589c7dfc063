#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "extension_policy.hpp"

class ByteRangeSource;
class StopSignal;

// Proxy identity of a remote file: SHA-256 of its policy window.
struct Fingerprint {
  static constexpr std::size_t kSize = 32;
  std::array<unsigned char, kSize> bytes{};

  std::string hex() const;
  static std::optional<Fingerprint> from_hex(const std::string& hex);
  static Fingerprint of(const char* data, std::size_t size);

  bool operator==(const Fingerprint& other) const { return bytes == other.bytes; }
  bool operator!=(const Fingerprint& other) const { return bytes != other.bytes; }
};

namespace std {
template<>
struct hash<Fingerprint> {
  std::size_t operator()(const Fingerprint& fp) const noexcept {
    // the digest is already uniformly distributed
    std::size_t value = 0;
    for(std::size_t i = 0; i < sizeof(value); ++i) {
      value = (value << 8) | fp.bytes[i];
    }
    return value;
  }
};
} // namespace std

class FingerprintEngine {
public:
  explicit FingerprintEngine(const ExtensionPolicyTable& policy);

  // Fetches only the policy window for `extension` and hashes it. A resource
  // shorter than skip + read is fingerprinted from offset 0 instead.
  // Throws FetchError / CancelledError from the source.
  Fingerprint fingerprint(ByteRangeSource& source,
                          const std::string& extension,
                          const StopSignal& stop) const;
  Fingerprint fingerprint(ByteRangeSource& source, const std::string& extension) const;

  // Same fingerprint for a file already on disk; extension taken from the name.
  Fingerprint fingerprint_local(const std::filesystem::path& path) const;

  const ExtensionPolicyTable& policy() const { return policy_; }

private:
  const ExtensionPolicyTable& policy_;
};
