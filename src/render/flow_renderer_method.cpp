/***
 * Name: FlowRenderer::RenderMethod / RenderCollapsed
 * Purpose: Method-level framing: subgraph, start marker, body, end marker.
 * Theory of Operation: Subgraph ids are generated (S1, S2, ...) and the method
 *   name is only the title, so names like `end` or `N1` cannot clash with
 *   keywords or node ids.
 */
#include "jflow/render/detail/flow_renderer.h"
#include "jflow/support/text.h"

namespace jflow::render::detail {

void FlowRenderer::RenderMethod(const model::MethodNode& method, const model::FlowSequence& flow) {
  const std::string name = support::SanitizeLabel(method.name);
  out_ << "  subgraph S" << ++subgraph_counter_ << "[\"" << name << "\"]\n";
  out_ << "    direction TB\n";
  const auto start = NextId();
  EmitNode(start, "([", name, "])", "public");
  EmitClick(start, method.range.first);

  const auto exits = RenderSequence(flow, Frontier{start}, std::nullopt);

  const auto end = NextId();
  EmitEdges(exits, end, std::nullopt);
  EmitNode(end, "([", "End of " + name, "])", "endNode");
  EmitClick(end, method.range.second);
  out_ << "  end\n";
}

void FlowRenderer::RenderCollapsed(const model::MethodNode& method) {
  const auto id = NextId();
  EmitNode(id, "([", support::SanitizeLabel(method.name), "])", "public");
  EmitClick(id, method.range.first);
}

}  // namespace jflow::render::detail
