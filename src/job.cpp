#include "job.hpp"

#include <stdexcept>

#include "extension_policy.hpp"
#include "utils.hpp"

Job make_job(Course course,
             std::string display_name,
             std::shared_ptr<ByteRangeSource> source,
             std::optional<uint64_t> declared_size,
             std::string location,
             std::string extension) {
  if(!source) {
    throw std::invalid_argument("Job '" + display_name + "' has no byte source");
  }
  auto job = std::make_shared<RemoteFileDescriptor>();
  job->course = std::move(course);
  job->extension = extension.empty()
    ? extension_of(display_name)
    : ExtensionPolicyTable::normalize_extension(extension);
  job->display_name = std::move(display_name);
  job->location = std::move(location);
  job->declared_size = declared_size;
  job->source = std::move(source);
  return job;
}
