#include "tasklex/util/logging.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tasklex::util {

namespace {

spdlog::level::level_enum levelFor(int verbosity, bool quiet) {
  if (quiet) {
    return spdlog::level::err;
  }
  if (verbosity >= 2) {
    return spdlog::level::debug;
  }
  return verbosity == 1 ? spdlog::level::info : spdlog::level::warn;
}

}  // namespace

void initializeLogging(int verbosity, bool quiet) {
  auto level = levelFor(verbosity, quiet);

  if (auto existing = spdlog::get("tasklex")) {
    existing->set_level(level);
    spdlog::set_default_logger(existing);
    return;
  }

  // Results go to stdout, so diagnostics stay on stderr
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("tasklex", console_sink);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(level);

  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);
}

}  // namespace tasklex::util
