#include <iostream>
#include <string>

#include "structwire/utils/config_loader.hpp"
#include "structwire/utils/log_config.hpp"

#include "inspect_commands.hpp"

using namespace structwire;
using namespace structwire::inspect;

int main(int argc, char** argv) {
  utils::ConfigLoader cfg;
  cfg.load_defaults({
    {"log.level", std::string("warning")},
    {"log.file", std::string("")},
    {"format", std::string("text")},
  });

  // The command line is parsed twice: once to find --config, once more to
  // override whatever the file and environment set.
  utils::ConfigLoader cli;
  cli.load_from_command_line(argc, argv);
  if (cli.has("config") && !cfg.load_from_file(cli.get_string("config"))) {
    std::cerr << "failed to load config file " << cli.get_string("config") << "\n";
    return kExitUsage;
  }
  cfg.load_from_environment("STRUCTWIRE_", {"log.level", "log.file", "format"});
  cfg.load_from_command_line(argc, argv);

  utils::log_utils::setup_basic_logging(
      utils::log_utils::parse_log_level(cfg.get_string("log.level")),
      true,
      cfg.get_string("log.file"));
  auto logger = utils::LogManager::instance().get_logger("structwire.inspect");

  if (cfg.positional().empty() || cfg.has("help")) {
    print_usage(std::cerr);
    return cfg.has("help") ? kExitOk : kExitUsage;
  }

  const std::string command = cfg.positional().front();
  STRUCTWIRE_LOG_DEBUG(logger, "command " + command);

  const int rc = run_command(command, cfg, logger, std::cout, std::cerr);
  utils::LogManager::instance().flush_all();
  return rc;
}
