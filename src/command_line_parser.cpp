#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"
#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json argv_spec)
  : process_name_(std::move(process_name)) {
  for(const auto& entry : argv_spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    positional_specs_.push_back(std::move(out));
  }
  std::sort(positional_specs_.begin(), positional_specs_.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe;
  for(const auto& spec : positional_specs_) {
    if(!probe.resolve_key(spec.key)) {
      throw ConfigError("ARGV specification references unknown setting '" + spec.key + "'");
    }
  }
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](const std::string& key_token, bool long_form) {
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) throw ConfigError("Unknown option --" + key_token);
        return false; // short tokens that match nothing are positional
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw ConfigError("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw ConfigError("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      auto body = token.substr(2);
      auto eq = body.find('=');
      if(eq != std::string::npos) {
        std::string error;
        auto resolved = settings.resolve_key(body.substr(0, eq));
        if(!resolved) throw ConfigError("Unknown option --" + body.substr(0, eq));
        if(!settings.set_from_string(*resolved, body.substr(eq + 1), error)) {
          throw ConfigError("Invalid value for option '" + body.substr(0, eq) + "': " + error);
        }
        continue;
      }
      handle_option(body, true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-') {
      if(handle_option(token.substr(1), false)) continue;
    }

    if(positional_index >= positional_specs_.size()) {
      throw ConfigError("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw ConfigError("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - deduplicating course material sync", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings.specification()) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::string aliases;
    if(entry.contains("aliases") && !entry.at("aliases").empty()) {
      aliases = " (alias: ";
      bool first = true;
      for(const auto& alias : entry.at("aliases")) {
        if(!first) aliases += ", ";
        aliases += "-" + alias.get<std::string>();
        first = false;
      }
      aliases += ")";
    }
    print_out(nullptr, "  --{:<26} {:<14} {}{} (current: {})",
              key,
              argument_hint,
              entry.value("description", ""),
              aliases,
              settings.value_as_string(key));
  }
  print_out(nullptr, "");
}
