/***
 * Name: jflow::support::JsonEscape
 * Purpose: Escape text for a JSON string literal.
 * Inputs: raw text
 * Outputs: escaped text (without surrounding quotes)
 * Theory of Operation: Escapes quote, backslash and the short control escapes;
 *   remaining control bytes are written as \u00XX. Other bytes pass through.
 */
#include "jflow/support/text.h"

#include <cstddef>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
#include <string_view>

namespace jflow {
namespace support {

std::string JsonEscape(std::string_view text) {  // NOLINT(readability-function-size)
  std::string out;
  constexpr std::size_t kReservePadding = 8;
  out.reserve(text.size() + kReservePadding);
  for (const char chr : text) {
    const auto uchar = static_cast<unsigned char>(chr);
    switch (uchar) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        constexpr unsigned char kMinPrintable = 0x20;
        if (uchar < kMinPrintable) {
          std::ostringstream hex;
          hex << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
              << static_cast<int>(uchar);
          out += hex.str();
        } else {
          out += chr;
        }
    }
  }
  return out;
}

}  // namespace support
}  // namespace jflow
