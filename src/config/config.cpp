#include "tasklex/config/config.hpp"

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "tasklex/nlp/language.hpp"
#include "tasklex/util/text.hpp"
#include "tasklex/util/xdg.hpp"

namespace tasklex::config {

namespace {

Result<suggest::InsertMode> parseInsertMode(const std::string& value) {
  if (value == "label") {
    return suggest::InsertMode::kLabel;
  }
  if (value == "value") {
    return suggest::InsertMode::kValue;
  }
  return makeErrorResult<suggest::InsertMode>(
      ErrorCode::kConfigError, "Invalid suggestions.insert '" + value + "' (expected label or value)");
}

// [[statuses]] / [[priorities]] array of tables
Result<core::Lexicon> parseLexicon(const toml::array& entries, std::string_view section) {
  core::Lexicon lexicon;
  int index = 0;
  for (const auto& node : entries) {
    const auto* table = node.as_table();
    if (!table) {
      return makeErrorResult<core::Lexicon>(ErrorCode::kConfigError,
                                            std::string(section) + " entries must be tables");
    }

    core::LexiconEntry entry;
    entry.id = (*table)["id"].value_or(std::string{});
    entry.value = (*table)["value"].value_or(entry.id);
    entry.label = (*table)["label"].value_or(entry.value);
    entry.is_terminal = (*table)["completed"].value_or(false);
    entry.order = static_cast<int>((*table)["order"].value_or(static_cast<int64_t>(index)));

    if (util::Text::isBlank(entry.value) && util::Text::isBlank(entry.label)) {
      return makeErrorResult<core::Lexicon>(
          ErrorCode::kConfigError,
          std::string(section) + " entry " + std::to_string(index) + " has no id, value or label");
    }

    lexicon.push_back(std::move(entry));
    ++index;
  }
  return lexicon;
}

}  // namespace

Config::Config()
    : triggers(core::TriggerConfig::defaults()),
      statuses(core::defaultStatuses()),
      priorities(core::defaultPriorities()) {}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["language"].value<std::string>()) {
      language = *value;
    }
    if (auto value = config_data["default_to_scheduled"].value<bool>()) {
      default_to_scheduled = *value;
    }

    // Suggestions
    if (auto suggestions_table = config_data["suggestions"].as_table()) {
      if (auto value = (*suggestions_table)["limit"].value<int64_t>()) {
        if (*value <= 0) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "suggestions.limit must be positive"));
        }
        suggestions.limit = static_cast<size_t>(*value);
      }
      if (auto value = (*suggestions_table)["insert"].value<std::string>()) {
        auto mode = parseInsertMode(*value);
        if (!mode.has_value()) {
          return std::unexpected(mode.error());
        }
        suggestions.insert = *mode;
      }
    }

    // Triggers, one table per property kind
    if (auto triggers_table = config_data["triggers"].as_table()) {
      for (const auto& [key, node] : *triggers_table) {
        auto kind = core::propertyKindFromString(key.str());
        if (!kind) {
          spdlog::warn("Ignoring unknown trigger kind '{}' in {}", key.str(), config_path.string());
          continue;
        }
        const auto* trigger_table = node.as_table();
        if (!trigger_table) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "triggers." + std::string(key.str()) + " must be a table"));
        }
        const auto& current = triggers.get(*kind);
        triggers.set(*kind, (*trigger_table)["trigger"].value_or(current.trigger),
                     (*trigger_table)["enabled"].value_or(current.enabled));
      }
    }

    // Lexicons
    if (auto statuses_array = config_data["statuses"].as_array()) {
      auto parsed = parseLexicon(*statuses_array, "statuses");
      if (!parsed.has_value()) {
        return std::unexpected(parsed.error());
      }
      statuses = std::move(*parsed);
    }
    if (auto priorities_array = config_data["priorities"].as_array()) {
      auto parsed = parseLexicon(*priorities_array, "priorities");
      if (!parsed.has_value()) {
        return std::unexpected(parsed.error());
      }
      priorities = std::move(*parsed);
    }

    spdlog::debug("Loaded config from {}", config_path.string());
    return validate();

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::validate() const {
  if (util::Text::isBlank(language)) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "language must not be empty"));
  }
  if (!nlp::isSupportedLanguage(language)) {
    spdlog::warn("Language '{}' is not supported, falling back to English", language);
  }
  if (suggestions.limit == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "suggestions.limit must be positive"));
  }
  return {};
}

nlp::ParserSettings Config::parserSettings() const {
  nlp::ParserSettings settings;
  settings.statuses = statuses;
  settings.priorities = priorities;
  settings.triggers = triggers;
  settings.language = language;
  settings.default_to_scheduled = default_to_scheduled;
  return settings;
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

Result<Config> Config::resolve(const std::optional<std::filesystem::path>& explicit_path) {
  Config config;

  if (explicit_path) {
    auto result = config.load(*explicit_path);
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
    return config;
  }

  auto default_path = defaultConfigPath();
  if (!std::filesystem::exists(default_path)) {
    spdlog::debug("No config at {}, using defaults", default_path.string());
    return config;
  }

  auto result = config.load(default_path);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return config;
}

}  // namespace tasklex::config
