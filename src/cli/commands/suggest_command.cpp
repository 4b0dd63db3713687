#include "tasklex/cli/commands/suggest_command.hpp"

#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

#include "tasklex/suggest/suggestion_service.hpp"

namespace tasklex::cli {

using suggest::InsertMode;
using suggest::SuggestionService;

SuggestCommand::SuggestCommand(Application& app) : app_(app) {
}

void SuggestCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("text", text_, "Input buffer")->required();
  cmd->add_option("--cursor", cursor_, "Cursor byte offset, defaults to the end of the text")
      ->check(CLI::NonNegativeNumber);
  cmd->add_option("--limit", limit_, "Maximum number of suggestions")->check(CLI::PositiveNumber);
  cmd->add_option("--select", select_, "Apply the Nth suggestion (1-based)")->check(CLI::PositiveNumber);
  cmd->add_option("--insert", insert_, "Insert the suggestion's label or value")
      ->check(CLI::IsMember({"label", "value"}));
}

Result<int> SuggestCommand::execute(const GlobalOptions& options) {
  auto& config = app_.config();
  SuggestionService service(config.triggers);

  size_t cursor = cursor_ < 0 ? text_.size() : static_cast<size_t>(cursor_);
  if (cursor > text_.size()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Cursor " + std::to_string(cursor) + " is past the end of the text"));
  }
  size_t limit = limit_ > 0 ? static_cast<size_t>(limit_) : config.suggestions.limit;
  InsertMode mode = config.suggestions.insert;
  if (!insert_.empty()) {
    mode = insert_ == "value" ? InsertMode::kValue : InsertMode::kLabel;
  }

  auto active = service.detectActiveTrigger(text_, cursor);
  auto suggestions = service.suggestionsAt(text_, cursor, config.statuses, config.priorities, limit);

  std::optional<suggest::SelectionResult> selection;
  if (select_ > 0) {
    auto index = static_cast<size_t>(select_);
    if (!active || index > suggestions.size()) {
      return std::unexpected(makeError(ErrorCode::kNotFound,
                                       "No suggestion " + std::to_string(index) + " to select"));
    }
    selection = SuggestionService::applySelection(text_, active->trigger, active->offset,
                                                  suggestions[index - 1], mode);
  }

  if (options.json) {
    nlohmann::json output;
    if (active) {
      output["trigger"] = {
        {"kind", std::string(core::propertyKindToString(active->kind))},
        {"offset", active->offset},
        {"trigger", active->trigger},
        {"query", active->query}
      };
    } else {
      output["trigger"] = nullptr;
    }

    nlohmann::json json_suggestions = nlohmann::json::array();
    for (const auto& suggestion : suggestions) {
      json_suggestions.push_back({
        {"value", suggestion.value},
        {"label", suggestion.label},
        {"display", suggestion.display},
        {"kind", std::string(core::propertyKindToString(suggestion.kind))}
      });
    }
    output["suggestions"] = json_suggestions;

    if (selection) {
      output["new_text"] = selection->new_text;
      output["new_cursor"] = selection->new_cursor;
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (!active) {
    std::cout << "No active trigger at offset " << cursor << "\n";
    return 0;
  }

  std::cout << "Trigger '" << active->trigger << "' (" << core::propertyKindToString(active->kind)
            << ") at " << active->offset << ", query '" << active->query << "'\n";
  if (suggestions.empty()) {
    std::cout << "No suggestions\n";
  }
  for (size_t i = 0; i < suggestions.size(); ++i) {
    std::cout << "  " << (i + 1) << ". " << suggestions[i].display;
    if (suggestions[i].value != suggestions[i].label) {
      std::cout << " (" << suggestions[i].value << ")";
    }
    std::cout << "\n";
  }
  if (selection) {
    std::cout << "\n" << selection->new_text << "\n"
              << "cursor: " << selection->new_cursor << "\n";
  }
  return 0;
}

} // namespace tasklex::cli
