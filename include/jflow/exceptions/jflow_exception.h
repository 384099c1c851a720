/***
 * Name: jflow::exceptions::JflowException
 * Purpose: Base class for all jflow exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text and a `category()` tag
 * Theory of Operation: Derives from std::exception to interoperate with catch sites.
 *   Each concrete type names its category so the CLI can print
 *   `jflow: <category>: <message>` without a type switch.
 */
#pragma once

#include <exception>
#include <string>
#include <utility>

namespace jflow {
namespace exceptions {

class JflowException : public std::exception {
 public:
  ~JflowException() noexcept override = default;
  const char* what() const noexcept override { return message_.c_str(); }

  /*** category: Short lowercase tag, e.g. "parse error". */
  virtual const char* category() const noexcept = 0;

 protected:
  explicit JflowException(std::string msg) noexcept : message_(std::move(msg)) {}
  std::string message_;
};

}  // namespace exceptions
}  // namespace jflow
