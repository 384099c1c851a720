/***
 * Name: jflow::render::IsSuppressed
 * Purpose: Apply the ignore sets to one call.
 * Theory of Operation: Internal calls and receiver-less calls are never hidden.
 *   A receiver matches a name when equal to it, when it continues with `name.`,
 *   or when its first segment equals it.
 */
#include <set>
#include <string>
#include <string_view>

#include "jflow/render/diagram_renderer.h"
#include "jflow/support/text.h"

namespace jflow::render {

static bool Matches(std::string_view receiver, const std::set<std::string>& names) {
  const auto prefix = support::ReceiverPrefix(receiver);
  for (const auto& name : names) {
    if (receiver == name || prefix == name) {
      return true;
    }
    if (receiver.size() > name.size() && receiver.compare(0, name.size(), name) == 0 &&
        receiver[name.size()] == '.') {
      return true;
    }
  }
  return false;
}

bool IsSuppressed(const model::CallStep& call, const RenderConfig& config) {
  if (!call.is_external || call.receiver.empty()) {
    return false;
  }
  return Matches(call.receiver, config.ignored_service_names) ||
         Matches(call.receiver, config.ignored_variable_names);
}

}  // namespace jflow::render
