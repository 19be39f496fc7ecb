#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace tether::common {

// Exception type for internal tether errors (engine bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in the tether engine.",
                context, detail)) {
  }
};

}  // namespace tether::common
