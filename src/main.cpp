#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>

#include "adapter_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    AdapterEngine::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = true;
    options.handle_signals = true;

    auto settings = std::make_shared<SettingsManager>();
    settings->set_workspace(options.workspace_root);
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "adaptermesh");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    AdapterEngine engine(settings, options);
    auto logger = engine.logger();

    engine.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }
    // After start() so a generated identity is persisted too.
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }
    logger->print("Node {} listening on port {}; type 'help' for commands",
                  engine.peer_id(), engine.listen_port());

    engine.run();
    engine.stop();

    return 0;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("adaptermesh-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
