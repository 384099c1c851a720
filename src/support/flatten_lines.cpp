/***
 * Name: jflow::support::FlattenLines
 * Purpose: Collapse multi-line source text onto one line.
 * Inputs: text
 * Outputs: copy with '\n' replaced by ' ' and '\r' removed
 */
#include "jflow/support/text.h"

#include <string>
#include <string_view>

namespace jflow {
namespace support {

std::string FlattenLines(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char chr : text) {
    if (chr == '\r') {
      continue;
    }
    out += (chr == '\n') ? ' ' : chr;
  }
  return out;
}

}  // namespace support
}  // namespace jflow
