/***
 * Name: jflow::render::RenderConfig
 * Purpose: Render-time filters and presentation switches.
 * Inputs: Populated by the driver from CLI options, or directly by API callers
 * Outputs: Read-only input to RenderDiagram
 * Theory of Operation: Ignore sets hold receiver names; a call whose receiver
 *   equals a name, starts with `name.`, or has that name as its first segment is
 *   left out of the diagram (it still counts as an external service).
 */
#pragma once

#include <set>
#include <string>

namespace jflow {
namespace render {

struct RenderConfig {
  std::set<std::string> ignored_variable_names;
  std::set<std::string> ignored_service_names;
  bool collapse_details{false};
  bool show_source_reference{false};
};

/*** DefaultIgnoredServices: Console streams hidden unless the user opts out. */
std::set<std::string> DefaultIgnoredServices();

}  // namespace render
}  // namespace jflow
