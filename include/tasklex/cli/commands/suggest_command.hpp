#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "tasklex/cli/application.hpp"

namespace tasklex::cli {

class SuggestCommand : public Command {
public:
  explicit SuggestCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "suggest"; }
  std::string description() const override { return "Complete the status or priority being typed"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Command options
  std::string text_;
  int cursor_ = -1;    // -1: end of text
  int limit_ = 0;      // 0: configured limit
  int select_ = 0;     // 0: nothing selected
  std::string insert_;
};

} // namespace tasklex::cli
