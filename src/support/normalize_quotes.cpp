/***
 * Name: jflow::support::NormalizeQuotes
 * Purpose: Replace double quotes so text can sit inside a quoted label.
 * Inputs: text
 * Outputs: copy with every '"' replaced by '\''
 */
#include "jflow/support/text.h"

#include <string>
#include <string_view>

namespace jflow {
namespace support {

std::string NormalizeQuotes(std::string_view text) {
  std::string out(text);
  for (char& chr : out) {
    if (chr == '"') {
      chr = '\'';
    }
  }
  return out;
}

}  // namespace support
}  // namespace jflow
