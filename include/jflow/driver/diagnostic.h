/***
 * Name: jflow::driver::Diagnostic
 * Purpose: Positioned error report for the terminal.
 * Inputs: file path, 1-based line and column, message
 * Outputs: `file:line:col: error: message`, the source line and a caret
 * Theory of Operation: The source line is taken from the text already in memory;
 *   color uses ANSI bold for the location and red for the label.
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "jflow/driver/cli.h"

namespace jflow {
namespace driver {

struct Diagnostic {
  std::string file;
  std::uint32_t line{0};
  std::uint32_t column{0};
  std::string message;
};

void PrintDiagnostic(const Diagnostic& diag, std::string_view source, bool color, std::ostream& err);

/*** UseEnvColor: True when JFLOW_COLOR is 1, true or yes (any case). */
bool UseEnvColor();

/*** ResolveColor: Apply --color; Auto means stderr is a terminal or UseEnvColor(). */
bool ResolveColor(CliOptions::ColorMode mode);

}  // namespace driver
}  // namespace jflow
