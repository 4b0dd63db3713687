#include "tasklex/cli/commands/parse_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tasklex/nlp/task_parser.hpp"
#include "tasklex/util/text.hpp"

namespace tasklex::cli {

ParseCommand::ParseCommand(Application& app) : app_(app) {
}

void ParseCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("text", words_, "Task text (read from stdin, one task per line, when omitted)");
  cmd->add_option("--date", date_, "Reference date (YYYY-MM-DD), defaults to today");
  cmd->add_option("--time", time_, "Reference time (HH:MM), defaults to now");
  cmd->add_flag("--scheduled", scheduled_, "File dates without a cue as scheduled instead of due");
}

Result<int> ParseCommand::execute(const GlobalOptions& options) {
  auto reference = referenceInstant();
  if (!reference.has_value()) {
    return std::unexpected(reference.error());
  }

  auto settings = app_.config().parserSettings();
  if (scheduled_) {
    settings.default_to_scheduled = true;
  }
  nlp::TaskParser parser(std::move(settings));

  auto inputs = collectInputs();
  if (inputs.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No task text given"));
  }

  if (options.json) {
    if (inputs.size() == 1) {
      std::cout << core::toJson(parser.parse(inputs.front(), *reference)).dump(2) << std::endl;
    } else {
      nlohmann::json output = nlohmann::json::array();
      for (const auto& input : inputs) {
        output.push_back(core::toJson(parser.parse(input, *reference)));
      }
      std::cout << output.dump(2) << std::endl;
    }
    return 0;
  }

  for (size_t i = 0; i < inputs.size(); ++i) {
    if (i > 0) {
      std::cout << "\n";
    }
    printResult(parser.parse(inputs[i], *reference));
  }
  return 0;
}

Result<nlp::ReferenceInstant> ParseCommand::referenceInstant() const {
  auto reference = nlp::ReferenceInstant::now();

  if (!date_.empty()) {
    auto date = core::parseDate(date_);
    if (!date) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid --date '" + date_ + "' (expected YYYY-MM-DD)"));
    }
    reference.date = *date;
    if (time_.empty()) {
      reference.time = core::TimeOfDay{0, 0};
    }
  }

  if (!time_.empty()) {
    auto time = core::TimeOfDay::parse(time_);
    if (!time) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid --time '" + time_ + "' (expected HH:MM)"));
    }
    reference.time = *time;
  }

  return reference;
}

std::vector<std::string> ParseCommand::collectInputs() const {
  if (!words_.empty()) {
    std::string text;
    for (const auto& word : words_) {
      if (!text.empty()) {
        text += ' ';
      }
      text += word;
    }
    return {text};
  }

  std::vector<std::string> inputs;
  std::string line;
  while (std::getline(std::cin, line)) {
    if (!util::Text::isBlank(line)) {
      inputs.push_back(line);
    }
  }
  return inputs;
}

void ParseCommand::printResult(const core::ExtractionResult& result) const {
  if (result.title.empty()) {
    std::cout << "(no title)\n";
  }
  for (const auto& part : core::previewParts(result)) {
    std::cout << part.text << "\n";
  }
}

} // namespace tasklex::cli
