#pragma once

#include <filesystem>

#include "byte_source.hpp"

class LocalFileSource : public ByteRangeSource {
public:
  explicit LocalFileSource(std::filesystem::path path, std::size_t chunk_size = 64 * 1024);

  RangeRead fetch_range(uint64_t offset, std::size_t length, const StopSignal& stop) override;
  uint64_t fetch_full(const ChunkSink& sink, const StopSignal& stop) override;
  std::string describe() const override;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::size_t chunk_size_;
};
