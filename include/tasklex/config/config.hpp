#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "tasklex/common.hpp"
#include "tasklex/core/lexicon.hpp"
#include "tasklex/core/trigger_config.hpp"
#include "tasklex/nlp/task_parser.hpp"
#include "tasklex/suggest/suggestion_service.hpp"

namespace tasklex::config {

/**
 * @brief Suggestion settings
 */
struct SuggestionsConfig {
  size_t limit = 10;
  suggest::InsertMode insert = suggest::InsertMode::kLabel;
};

/**
 * @brief Main configuration class
 *
 * Every field starts at its default, so a config file only needs the keys it
 * wants to change. Lexicon arrays replace the defaults wholesale.
 */
class Config {
 public:
  Config();

  // Language profile code, see availableLanguages()
  std::string language = "en";

  // Uncued date phrases fill the scheduled slot instead of due
  bool default_to_scheduled = false;

  SuggestionsConfig suggestions;
  core::TriggerConfig triggers;
  core::Lexicon statuses;
  core::Lexicon priorities;

  /**
   * @brief Load configuration from TOML file
   * @param config_path Path to config file
   * @return Result indicating success or failure
   */
  Result<void> load(const std::filesystem::path& config_path);

  /**
   * @brief Check values that parse but make no sense
   */
  Result<void> validate() const;

  /**
   * @brief Engine settings built from this configuration
   */
  nlp::ParserSettings parserSettings() const;

  const std::filesystem::path& path() const { return config_path_; }

  /**
   * @brief Get default config file path
   */
  static std::filesystem::path defaultConfigPath();

  /**
   * @brief Load the explicit file, or the default one when present
   *
   * A missing default file yields the defaults. An explicit path that is
   * missing or malformed is an error.
   */
  static Result<Config> resolve(const std::optional<std::filesystem::path>& explicit_path);

 private:
  std::filesystem::path config_path_;
};

}  // namespace tasklex::config
