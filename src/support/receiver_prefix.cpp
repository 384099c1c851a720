/***
 * Name: jflow::support::ReceiverPrefix
 * Purpose: Reduce a call receiver to the service name shown to users.
 * Inputs: receiver text (e.g. "repo", "System.out", "this.client", "repoFor(cfg.name)")
 * Outputs: text before the first '.' outside (), [] and {}, or the whole receiver
 * Theory of Operation: Tracks bracket depth so dots inside call arguments or
 *   index expressions never split the receiver.
 */
#include "jflow/support/text.h"

#include <cstddef>
#include <string_view>

namespace jflow {
namespace support {

std::string_view ReceiverPrefix(std::string_view receiver) {
  int depth = 0;
  for (std::size_t i = 0; i < receiver.size(); ++i) {
    switch (receiver[i]) {
      case '(':
      case '[':
      case '{':
        ++depth;
        break;
      case ')':
      case ']':
      case '}':
        if (depth > 0) {
          --depth;
        }
        break;
      case '.':
        if (depth == 0) {
          return receiver.substr(0, i);
        }
        break;
      default:
        break;
    }
  }
  return receiver;
}

}  // namespace support
}  // namespace jflow
