#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "notifier.hpp"
#include "run_config.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "sync_profile.hpp"
#include "utils.hpp"

int main(int argc, char** argv){
  try {
    init(false);
    auto logger = std::make_shared<Logger>("syncb");

    SettingsManager settings;
    settings.load();

    std::string process_name = "syncb";
    if(argc > 0 && argv && argv[0]) {
      process_name = std::filesystem::path(argv[0]).filename().string();
    }
    CommandLineParser parser(process_name);
    parser.parse(argc, argv, settings);
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    const bool verbose = settings.get<bool>("verbose");
    init(verbose);
    if(verbose) {
      logger->debug("Verbose logging enabled");
    }

    if(settings.save_requested()) {
      if(settings.save()) {
        logger->info("Settings saved to {}", settings.settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    std::string error;
    auto profile = load_sync_profile(profile_search_paths(settings.get<std::string>("config")), error);
    if(!profile) {
      logger->error("{}", error);
      return 1;
    }
    logger->debug("Profile loaded from {}", profile->source_file.string());

    if(!attach_log_file(profile->log_file)) {
      logger->warn("Continuing without log file {}", profile->log_file.string());
    }

    if(settings.get<bool>("force_unlock")) {
      return SyncEngine::force_release_lock(profile->lock_file, logger.get()) ? 0 : 1;
    }

    auto built = build_run_config(settings, *profile, local_hostname());
    if(!built.config) {
      logger->error("{}", built.error);
      parser.usage();
      return 1;
    }

    SyncEngine engine(std::move(*built.config),
                      std::move(built.host_context),
                      logger,
                      std::make_shared<LogNotifier>(logger));
    return engine.run_sync();
  } catch(std::exception& e) {
    init(false);
    Logger logger("syncb-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
