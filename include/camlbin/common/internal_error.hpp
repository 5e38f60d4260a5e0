#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace camlbin::common {

// Exception type for internal camlbin errors (library bugs, not bad input).
// Malformed input is reported through reader::Result, never through this.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in camlbin, not a problem with the input.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace camlbin::common
