/***
 * Name: jflow::render (diagram renderer)
 * Purpose: Turn a CallGraph into mermaid flowchart text.
 * Inputs:
 *   - graph: assembled call graph
 *   - source: the text the graph was built from (used to validate ranges)
 *   - method: optional target method name
 *   - config: filters and switches
 * Outputs: DiagramResult
 * Theory of Operation: Select targets, collect external services over their full
 *   flows, then either emit one placeholder per method (collapse) or expand each
 *   method with a fresh detail::FlowRenderer. The counter behind node ids lives
 *   in that renderer, so identical inputs always give identical text.
 *   Throws exceptions::RenderError if a target's range lies outside `source`.
 */
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "jflow/model/call_graph.h"
#include "jflow/model/flow_step.h"
#include "jflow/render/diagram_result.h"
#include "jflow/render/render_config.h"

namespace jflow {
namespace render {

struct TargetSelection {
  std::vector<std::string> methods;
  bool resolved{false};  // true when `method` named a declared method
};

/*** SelectTargets: The named method when declared, else every public/protected method by name. */
TargetSelection SelectTargets(const model::CallGraph& graph, const std::optional<std::string>& method);

/*** CollectExternalServices: Receiver prefixes of external calls, filters not applied. */
std::vector<std::string> CollectExternalServices(const model::CallGraph& graph,
                                                 const std::vector<std::string>& methods);

/*** IsSuppressed: True for an external call whose receiver matches an ignore set. */
bool IsSuppressed(const model::CallStep& call, const RenderConfig& config);

void WriteStyleClasses(std::ostream& out);

DiagramResult RenderDiagram(const model::CallGraph& graph,
                            std::string_view source,
                            const std::optional<std::string>& method,
                            const RenderConfig& config);

}  // namespace render
}  // namespace jflow
