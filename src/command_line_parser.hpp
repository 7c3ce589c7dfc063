#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings: "--key value", "-alias value", bare flags for
// booleans, and positional arguments in `argv_spec` order.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "coursesync",
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","manifest"}},
                      {{"index",1},{"key","download_dir"}}
                    }));

  // Throws ConfigError on unknown options or invalid values.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::vector<ArgvSpec> positional_specs_;
};
