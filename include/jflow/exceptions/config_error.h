/***
 * Name: jflow::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Category "configuration error".
 */
#pragma once

#include <string>
#include <utility>

#include "jflow/exceptions/jflow_exception.h"

namespace jflow {
namespace exceptions {

class ConfigError : public JflowException {
 public:
  explicit ConfigError(std::string msg) noexcept : JflowException(std::move(msg)) {}
  const char* category() const noexcept override { return "configuration error"; }
};

}  // namespace exceptions
}  // namespace jflow
