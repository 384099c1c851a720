/***
 * Name: jflow::render::RenderDiagram
 * Purpose: Produce the mermaid flowchart and external service list for a graph.
 * Inputs: graph, source, optional target method, config
 * Outputs: DiagramResult
 * Theory of Operation: Ranges are checked against the source before any output
 *   is produced. Collapse applies only when no declared method was targeted.
 */
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "jflow/exceptions/render_error.h"
#include "jflow/render/detail/flow_renderer.h"
#include "jflow/render/diagram_renderer.h"

namespace jflow::render {

static void CheckRanges(const model::CallGraph& graph, const TargetSelection& selection,
                        std::string_view source) {
  for (const auto& name : selection.methods) {
    const auto& range = graph.nodes.at(name).range;
    if (range.first > range.second || range.second > source.size()) {
      throw exceptions::RenderError("method '" + name + "' spans bytes " +
                                    std::to_string(range.first) + ".." +
                                    std::to_string(range.second) +
                                    " outside a source of " + std::to_string(source.size()) +
                                    " bytes");
    }
  }
}

DiagramResult RenderDiagram(const model::CallGraph& graph,
                            std::string_view source,
                            const std::optional<std::string>& method,
                            const RenderConfig& config) {
  const auto selection = SelectTargets(graph, method);
  CheckRanges(graph, selection, source);

  DiagramResult result;
  result.external_services = CollectExternalServices(graph, selection.methods);

  std::ostringstream out;
  out << "flowchart TD\n";
  detail::FlowRenderer renderer(config, out);
  const bool collapse = config.collapse_details && !selection.resolved;
  static const model::FlowSequence kEmptyFlow;
  for (const auto& name : selection.methods) {
    const auto& node = graph.nodes.at(name);
    if (collapse) {
      renderer.RenderCollapsed(node);
      continue;
    }
    const auto flow = graph.flows.find(name);
    renderer.RenderMethod(node, flow == graph.flows.end() ? kEmptyFlow : flow->second);
  }
  WriteStyleClasses(out);
  result.diagram_text = out.str();
  return result;
}

}  // namespace jflow::render
