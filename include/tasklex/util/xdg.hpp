#pragma once

#include <filesystem>
#include <string>

namespace tasklex::util {

// XDG Base Directory lookups for tasklex files
class Xdg {
 public:
  // $XDG_CONFIG_HOME/tasklex, or ~/.config/tasklex
  static std::filesystem::path configHome();

  // configHome()/config.toml
  static std::filesystem::path configFile();

 private:
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace tasklex::util
