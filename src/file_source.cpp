#include "file_source.hpp"

#include <algorithm>
#include <fstream>

#include "errors.hpp"
#include "stop_signal.hpp"

LocalFileSource::LocalFileSource(std::filesystem::path path, std::size_t chunk_size)
  : path_(std::move(path)),
    chunk_size_(chunk_size == 0 ? 64 * 1024 : chunk_size) {}

std::string LocalFileSource::describe() const {
  return "file://" + path_.string();
}

RangeRead LocalFileSource::fetch_range(uint64_t offset, std::size_t length, const StopSignal& stop) {
  stop.throw_if_stopped();
  std::error_code ec;
  auto total = std::filesystem::file_size(path_, ec);
  if(ec) {
    throw FetchError("Cannot stat " + path_.string() + ": " + ec.message());
  }
  RangeRead out;
  out.total_size = total;
  if(offset >= total || length == 0) return out;

  std::ifstream in(path_, std::ios::binary);
  if(!in) throw FetchError("Cannot open " + path_.string());
  auto count = static_cast<std::size_t>(std::min<uint64_t>(length, total - offset));
  out.data.resize(count);
  in.seekg(static_cast<std::streamoff>(offset));
  in.read(out.data.data(), static_cast<std::streamsize>(count));
  if(in.gcount() != static_cast<std::streamsize>(count)) {
    throw FetchError("Short read from " + path_.string());
  }
  return out;
}

uint64_t LocalFileSource::fetch_full(const ChunkSink& sink, const StopSignal& stop) {
  std::ifstream in(path_, std::ios::binary);
  if(!in) throw FetchError("Cannot open " + path_.string());
  std::vector<char> buffer(chunk_size_);
  uint64_t total = 0;
  while(in) {
    stop.throw_if_stopped();
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got <= 0) break;
    sink(buffer.data(), static_cast<std::size_t>(got));
    total += static_cast<uint64_t>(got);
  }
  if(in.bad()) throw FetchError("Read error on " + path_.string());
  return total;
}
