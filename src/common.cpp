#include "tasklex/common.hpp"

#include <fmt/format.h>

namespace tasklex {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "success";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kConfigError:
      return "config_error";
    case ErrorCode::kNotFound:
      return "not_found";
  }
  return "unknown";
}

std::string Version::toString() const {
  auto text = fmt::format("{}.{}.{}", major, minor, patch);
  if (!build.empty()) {
    text += "+" + build;
  }
  return text;
}

Version getVersion() {
  return Version{0, 1, 0, ""};
}

}  // namespace tasklex
