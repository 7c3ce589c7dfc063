#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "byte_source.hpp"

struct Course {
  std::string id;
  std::string display_name;
};

// One candidate file as handed over by enumeration. Immutable once built;
// shared between the queue, the worker processing it and its result.
struct RemoteFileDescriptor {
  Course course;
  std::string display_name;
  std::string extension;             // lower case with leading dot, may be empty
  std::string location;              // sub directory inside the course, may be empty
  std::optional<uint64_t> declared_size; // advisory only
  std::shared_ptr<ByteRangeSource> source;

  std::string label() const { return course.id + "/" + display_name; }
};

using Job = std::shared_ptr<const RemoteFileDescriptor>;

// Fills in the extension from the display name when none was given.
Job make_job(Course course,
             std::string display_name,
             std::shared_ptr<ByteRangeSource> source,
             std::optional<uint64_t> declared_size = std::nullopt,
             std::string location = {},
             std::string extension = {});
