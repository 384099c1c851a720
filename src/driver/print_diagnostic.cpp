/***
 * Name: jflow::driver::PrintDiagnostic
 * Purpose: Print a positioned error with the offending source line and a caret.
 * Inputs:
 *   - diag: file, 1-based line/column, message
 *   - source: text the position refers to
 *   - color: emit ANSI escapes
 *   - err: destination stream
 * Outputs: None
 * Theory of Operation: Header and caret are skipped when the position is unknown
 *   or past the end of the source.
 */
#include "jflow/driver/diagnostic.h"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace jflow::driver {

// ANSI fragments
static constexpr std::string_view kRed = "\033[31m";
static constexpr std::string_view kBold = "\033[1m";
static constexpr std::string_view kReset = "\033[0m";

static void PrintHeader(const Diagnostic& diag, const bool color, std::ostream& err) {
  if (diag.file.empty()) {
    err << "jflow: ";
    return;
  }
  if (color) { err << kBold; }
  err << diag.file;
  if (diag.line > 0) {
    err << ':' << diag.line << ':' << diag.column;
  }
  err << ": ";
  if (color) { err << kReset; }
}

static void PrintLabel(const bool color, std::ostream& err) {
  if (color) {
    err << kRed << "error: " << kReset;
  } else {
    err << "error: ";
  }
}

static std::string_view SourceLine(std::string_view source, std::uint32_t line) {
  std::size_t start = 0;
  for (std::uint32_t current = 1; current < line; ++current) {
    const auto newline = source.find('\n', start);
    if (newline == std::string_view::npos) {
      return {};
    }
    start = newline + 1;
  }
  auto end = source.find('\n', start);
  if (end == std::string_view::npos) {
    end = source.size();
  }
  auto text = source.substr(start, end - start);
  if (!text.empty() && text.back() == '\r') {
    text.remove_suffix(1);
  }
  return text;
}

static void PrintSourceWithCaret(const Diagnostic& diag, std::string_view source, std::ostream& err) {
  if (diag.line == 0 || diag.column == 0) { return; }
  const auto text = SourceLine(source, diag.line);
  if (text.empty()) { return; }
  err << "  " << text << "\n";
  err << "  ";
  for (std::uint32_t i = 1; i < diag.column; ++i) {
    const char ch = i - 1 < text.size() ? text[i - 1] : ' ';
    err << (ch == '\t' ? '\t' : ' ');
  }
  err << "^\n";
}

void PrintDiagnostic(const Diagnostic& diag, std::string_view source, bool color, std::ostream& err) {
  PrintHeader(diag, color, err);
  PrintLabel(color, err);
  err << diag.message << "\n";
  PrintSourceWithCaret(diag, source, err);
}

}  // namespace jflow::driver
