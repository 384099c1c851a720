/***
 * Name: jflow::exceptions::ParseError
 * Purpose: Exception for failures turning Java source into a syntax tree.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Category "parse error".
 */
#pragma once

#include <string>
#include <utility>

#include "jflow/exceptions/jflow_exception.h"

namespace jflow {
namespace exceptions {

class ParseError : public JflowException {
 public:
  explicit ParseError(std::string msg) noexcept : JflowException(std::move(msg)) {}
  const char* category() const noexcept override { return "parse error"; }
};

}  // namespace exceptions
}  // namespace jflow
