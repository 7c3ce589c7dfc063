#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class StopSignal;

struct RangeRead {
  std::vector<char> data;
  // Length of the whole resource, when the source knows it.
  std::optional<uint64_t> total_size;
};

using ChunkSink = std::function<void(const char* data, std::size_t size)>;

// Capability a remote file is reached through. Implementations throw
// FetchError on transport failures and CancelledError once `stop` fires.
class ByteRangeSource {
public:
  virtual ~ByteRangeSource() = default;

  // Up to `length` bytes starting at `offset`. An offset at or past the end
  // yields an empty read rather than an error.
  virtual RangeRead fetch_range(uint64_t offset, std::size_t length, const StopSignal& stop) = 0;

  // Streams the whole resource into `sink` and returns the byte count.
  virtual uint64_t fetch_full(const ChunkSink& sink, const StopSignal& stop) = 0;

  virtual std::string describe() const = 0;
};
