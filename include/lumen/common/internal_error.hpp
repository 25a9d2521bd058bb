#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace lumen::common {

// Exception type for internal compiler errors (broken invariants inside
// lumen itself, not malformed input or unsupported targets)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in the lumen code generator.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace lumen::common
