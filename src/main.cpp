#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"

constexpr int kExitFailures = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

int main(int argc, char** argv){
  try {
    SyncEngine::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.handle_signals = true;

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".coursesync" / "settings.json");
    // no saved settings on first run
    (void)settings->load();

    CommandLineParser parser("coursesync");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const ConfigError& e) {
      init(false);
      print_err(nullptr, "{}", e.what());
      parser.usage(*settings);
      return kExitUsage;
    }
    if(settings->help_requested()) {
      init(false);
      parser.usage(*settings);
      return 0;
    }

    SyncEngine engine(settings, options);
    try {
      engine.start();
    } catch(const ConfigError& e) {
      init(false);
      print_err(nullptr, "Invalid configuration: {}", e.what());
      return kExitUsage;
    }

    auto logger = engine.logger();
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(settings->save()) {
        logger->info("Saved settings to {}", settings->settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    if(settings->get<bool>("rebuild_index")) {
      auto added = engine.rebuild_index();
      logger->print("Index rebuilt: {} new fingerprints", added);
      flush_logs();
      return engine.stop_requested() ? kExitInterrupted : 0;
    }

    auto summary = engine.run();
    engine.reporter().print_report();
    flush_logs();

    if(engine.stop_requested()) return kExitInterrupted;
    return summary.failed > 0 ? kExitFailures : 0;
  } catch(const ConfigError& e) {
    init(false);
    Logger logger("coursesync");
    logger.error("{}", e.what());
    return kExitUsage;
  } catch(std::exception& e) {
    init(false);
    Logger logger("coursesync");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return kExitFailures;
  }
}
