#include "tasklex/cli/commands/languages_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "tasklex/nlp/language.hpp"

namespace tasklex::cli {

LanguagesCommand::LanguagesCommand(Application& app) : app_(app) {
}

Result<int> LanguagesCommand::execute(const GlobalOptions& options) {
  const auto& configured = nlp::languageProfile(app_.config().language);

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& code : nlp::availableLanguages()) {
      const auto& profile = nlp::languageProfile(code);
      output.push_back({
        {"code", profile.code},
        {"name", profile.name},
        {"active", profile.code == configured.code}
      });
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  for (const auto& code : nlp::availableLanguages()) {
    const auto& profile = nlp::languageProfile(code);
    std::cout << (profile.code == configured.code ? "* " : "  ") << profile.code << "  "
              << profile.name << "\n";
  }
  return 0;
}

} // namespace tasklex::cli
