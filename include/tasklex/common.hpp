#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace tasklex {

// Failures surfaced by configuration loading and the command line.
// Extraction itself never fails; unrecognized input stays in the title.
enum class ErrorCode {
  kSuccess = 0,
  kInvalidArgument,
  kConfigError,
  kNotFound
};

std::string_view errorCodeToString(ErrorCode code);

/**
 * @brief Error code plus a message meant for the user
 */
class Error {
 public:
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

 private:
  ErrorCode code_;
  std::string message_;
};

template <typename T>
using Result = std::expected<T, Error>;

inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

template<typename T>
inline Result<T> makeErrorResult(ErrorCode code, const std::string& message) {
  return std::unexpected(makeError(code, message));
}

struct Version {
  int major;
  int minor;
  int patch;
  std::string build;

  std::string toString() const;
};

Version getVersion();

}  // namespace tasklex
