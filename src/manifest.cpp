#include "manifest.hpp"

#include <fstream>

#include "errors.hpp"
#include "file_source.hpp"
#include "http_source.hpp"
#include "log.hpp"
#include "sync_config.hpp"
#include "utils.hpp"

namespace {

std::string id_string(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  if(value.is_number_integer()) return std::to_string(value.get<long long>());
  throw ConfigError("course id must be a string or an integer");
}

bool has_scheme(const std::string& url, const std::string& scheme) {
  return to_lower_copy(url.substr(0, scheme.size())) == scheme;
}

} // namespace

Manifest Manifest::load(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw ConfigError("Unable to open manifest " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw ConfigError("Manifest " + path.string() + " is not valid JSON: " + e.what());
  }
  auto base = path.has_parent_path() ? path.parent_path() : std::filesystem::current_path();
  return from_json(doc, std::filesystem::absolute(base));
}

Manifest Manifest::from_json(const nlohmann::json& doc, std::filesystem::path base_dir) {
  Manifest manifest;
  manifest.base_dir_ = std::move(base_dir);

  if(!doc.is_object() || !doc.contains("courses") || !doc.at("courses").is_array()) {
    throw ConfigError("Manifest must be an object with a \"courses\" array");
  }

  try {
    for(const auto& course_json : doc.at("courses")) {
      CourseEntry course;
      course.course.id = id_string(course_json.at("id"));
      if(course.course.id.empty()) throw ConfigError("course id must not be empty");
      course.course.display_name = course_json.value("name", course.course.id);

      if(course_json.contains("files")) {
        for(const auto& file_json : course_json.at("files")) {
          FileEntry file;
          file.name = file_json.at("name").get<std::string>();
          file.url = file_json.at("url").get<std::string>();
          if(file.name.empty() || file.url.empty()) {
            throw ConfigError("file in course " + course.course.id + " needs a name and a url");
          }
          if(file_json.contains("size") && !file_json.at("size").is_null()) {
            file.size = file_json.at("size").get<uint64_t>();
          }
          file.location = file_json.value("location", "");
          file.extension = file_json.value("extension", "");
          if(file_json.contains("headers")) {
            for(const auto& [key, value] : file_json.at("headers").items()) {
              file.headers[key] = value.get<std::string>();
            }
          }
          course.files.push_back(std::move(file));
        }
      }
      manifest.courses_.push_back(std::move(course));
    }
  } catch(const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Malformed manifest: ") + e.what());
  }
  return manifest;
}

std::vector<Course> Manifest::selected_courses(const SyncConfig& config) const {
  std::vector<Course> out;
  for(const auto& entry : courses_) {
    if(config.course_selected(entry.course.id)) out.push_back(entry.course);
  }
  return out;
}

std::size_t Manifest::file_count() const {
  std::size_t count = 0;
  for(const auto& entry : courses_) count += entry.files.size();
  return count;
}

std::shared_ptr<ByteRangeSource> Manifest::make_source(const FileEntry& file,
                                                       std::chrono::milliseconds timeout) const {
  if(has_scheme(file.url, "http://") || has_scheme(file.url, "https://")) {
    HttpRangeSource::Options options;
    options.timeout = timeout;
    options.headers = file.headers;
    return std::make_shared<HttpRangeSource>(file.url, options);
  }
  std::filesystem::path path = has_scheme(file.url, "file://")
    ? std::filesystem::path(file.url.substr(7))
    : std::filesystem::path(file.url);
  if(path.is_relative()) path = base_dir_ / path;
  return std::make_shared<LocalFileSource>(path);
}

std::size_t Manifest::enumerate(const SyncConfig& config,
                                const std::function<bool(Job)>& sink) const {
  std::size_t accepted = 0;
  for(const auto& entry : courses_) {
    if(!config.course_selected(entry.course.id)) continue;
    for(const auto& file : entry.files) {
      std::shared_ptr<ByteRangeSource> source;
      try {
        source = make_source(file, config.request_timeout);
      } catch(const FetchError& e) {
        log_warn(nullptr, "Ignoring {}/{}: {}", entry.course.id, file.name, e.what());
        continue;
      }
      auto job = make_job(entry.course,
                          file.name,
                          std::move(source),
                          file.size,
                          file.location,
                          file.extension);
      if(!sink(std::move(job))) return accepted;
      ++accepted;
    }
  }
  return accepted;
}
