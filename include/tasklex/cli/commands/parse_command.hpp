#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "tasklex/cli/application.hpp"
#include "tasklex/core/extraction_result.hpp"
#include "tasklex/nlp/date_phrase.hpp"

namespace tasklex::cli {

class ParseCommand : public Command {
public:
  explicit ParseCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "parse"; }
  std::string description() const override { return "Extract task properties from text"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Command options
  std::vector<std::string> words_;
  std::string date_;
  std::string time_;
  bool scheduled_ = false;

  Result<nlp::ReferenceInstant> referenceInstant() const;
  std::vector<std::string> collectInputs() const;
  void printResult(const core::ExtractionResult& result) const;
};

} // namespace tasklex::cli
