/***
 * Name: jflow::Render
 * Purpose: CallGraph to mermaid flowchart and external service list.
 */
#include <optional>
#include <string>
#include <string_view>

#include "jflow/jflow.h"
#include "jflow/render/diagram_renderer.h"

namespace jflow {

render::DiagramResult Render(const model::CallGraph& graph,
                             std::string_view source,
                             const std::optional<std::string>& method,
                             const render::RenderConfig& config) {
  return render::RenderDiagram(graph, source, method, config);
}

}  // namespace jflow
