/***
 * Name: jflow::support::Trim
 * Purpose: Remove leading and trailing ASCII whitespace from a string_view.
 * Inputs: text
 * Outputs: narrowed view
 */
#include "jflow/support/text.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace jflow {
namespace support {

std::string_view Trim(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

}  // namespace support
}  // namespace jflow
