#pragma once

#include <stdexcept>
#include <string>

namespace pricer {

// Raised for any caller-supplied parameter that violates a pricing
// precondition. The message names the constraint that failed.
class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
  explicit InvalidArgument(const char* what) : std::invalid_argument(what) {}
};

}  // namespace pricer
