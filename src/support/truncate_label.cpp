/***
 * Name: jflow::support::TruncateLabel
 * Purpose: Shorten long display labels with a trailing ellipsis.
 * Inputs:
 *   - text: label to shorten
 *   - limit: labels longer than this many bytes are cut
 *   - keep: number of bytes kept before "..."
 * Outputs: shortened label
 * Theory of Operation: The cut point backs off to a UTF-8 lead byte so a
 *   multi-byte character is never split.
 */
#include "jflow/support/text.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace jflow {
namespace support {

std::string TruncateLabel(std::string_view text, std::size_t limit, std::size_t keep) {
  if (text.size() <= limit) {
    return std::string(text);
  }
  std::size_t cut = keep < text.size() ? keep : text.size();
  constexpr unsigned char kContinuationMask = 0xC0;
  constexpr unsigned char kContinuationTag = 0x80;
  while (cut > 0 && cut < text.size() && (static_cast<unsigned char>(text[cut]) & kContinuationMask) == kContinuationTag) {
    --cut;
  }
  std::string out(text.substr(0, cut));
  out += "...";
  return out;
}

}  // namespace support
}  // namespace jflow
