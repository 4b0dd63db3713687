#include "tasklex/cli/application.hpp"

#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "tasklex/util/logging.hpp"

#include "tasklex/cli/commands/languages_command.hpp"
#include "tasklex/cli/commands/parse_command.hpp"
#include "tasklex/cli/commands/suggest_command.hpp"

namespace tasklex::cli {

Application::Application()
    : app_("tasklex", "Extract task properties from natural language") {
  app_.set_version_flag("--version", tasklex::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

Application::Application(config::Config config) : Application() {
  config_ = std::move(config);
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output (-vv for debug)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--lang", global_options_.language,
                  "Language profile (see the languages command)");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<ParseCommand>(*this));
  registerCommand(std::make_unique<SuggestCommand>(*this));
  registerCommand(std::make_unique<LanguagesCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  tasklex parse "Call Anna tomorrow at 3pm @phone #work high"
  tasklex parse --json "Review report every other week 2 hours"
  tasklex --lang de parse "Bericht morgen um 14 uhr"
  tasklex suggest "Task *in progress" --cursor 8
  tasklex suggest "Task *act" --select 1

For more information on a specific command, run:
  tasklex <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    util::initializeLogging(global_options_.verbose, global_options_.quiet);

    auto init_result = initializeConfig();
    if (!init_result.has_value()) {
      printError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      printError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeConfig() {
  if (config_initialized_) {
    return {};
  }

  if (!config_) {
    std::optional<std::filesystem::path> config_path;
    if (!global_options_.config_file.empty()) {
      config_path = global_options_.config_file;
    }

    auto config_result = config::Config::resolve(config_path);
    if (!config_result.has_value()) {
      return std::unexpected(config_result.error());
    }
    config_ = std::move(*config_result);
  }

  // Command line overrides
  if (!global_options_.language.empty()) {
    config_->language = global_options_.language;
    auto valid = config_->validate();
    if (!valid.has_value()) {
      return valid;
    }
  }

  config_initialized_ = true;
  return {};
}

void Application::printError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = std::string(errorCodeToString(error.code()));
    std::cout << output.dump() << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!config_initialized_ || !config_) {
    throw std::runtime_error("Configuration not initialized");
  }
  return *config_;
}

} // namespace tasklex::cli
