#pragma once

/// @file exception.h
/// @brief Exception type and check macros for masterprint.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace masterprint {

/// @brief Base exception class for masterprint errors.
class MasterprintException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit MasterprintException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  MasterprintException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def MASTERPRINT_CHECK
/// @brief Throws MasterprintException if condition is false.
#define MASTERPRINT_CHECK(cond, code)   \
  do {                                  \
    if (!(cond)) {                      \
      throw MasterprintException(code); \
    }                                   \
  } while (0)

/// @def MASTERPRINT_CHECK_MSG
/// @brief Throws MasterprintException with custom message if condition is false.
#define MASTERPRINT_CHECK_MSG(cond, code, msg) \
  do {                                         \
    if (!(cond)) {                             \
      throw MasterprintException(code, msg);   \
    }                                          \
  } while (0)

}  // namespace masterprint
