/***
 * Name: jflow::exceptions::RenderError
 * Purpose: Exception for diagram rendering against a graph that does not match its source.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Category "render error".
 */
#pragma once

#include <string>
#include <utility>

#include "jflow/exceptions/jflow_exception.h"

namespace jflow {
namespace exceptions {

class RenderError : public JflowException {
 public:
  explicit RenderError(std::string msg) noexcept : JflowException(std::move(msg)) {}
  const char* category() const noexcept override { return "render error"; }
};

}  // namespace exceptions
}  // namespace jflow
