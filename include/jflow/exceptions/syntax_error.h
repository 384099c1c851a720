/***
 * Name: jflow::exceptions::SyntaxError
 * Purpose: Parse failure raised in strict mode when the tree contains ERROR or MISSING nodes.
 * Inputs: Message plus 1-based line/column of the first offending node
 * Outputs: Exception object with position accessors
 * Theory of Operation: Refines ParseError so callers catching ParseError still see it.
 */
#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "jflow/exceptions/parse_error.h"

namespace jflow {
namespace exceptions {

class SyntaxError : public ParseError {
 public:
  SyntaxError(std::string msg, std::uint32_t line, std::uint32_t column) noexcept
      : ParseError(std::move(msg)), line_(line), column_(column) {}

  const char* category() const noexcept override { return "syntax error"; }

  std::uint32_t line() const noexcept { return line_; }
  std::uint32_t column() const noexcept { return column_; }

 private:
  std::uint32_t line_;
  std::uint32_t column_;
};

}  // namespace exceptions
}  // namespace jflow
