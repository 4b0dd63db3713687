#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "tasklex/cli/application.hpp"

namespace tasklex::cli {

class LanguagesCommand : public Command {
public:
  explicit LanguagesCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "languages"; }
  std::string description() const override { return "List supported language profiles"; }

private:
  Application& app_;
};

} // namespace tasklex::cli
