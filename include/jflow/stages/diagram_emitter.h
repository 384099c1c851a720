/***
 * Name: jflow::stages::DiagramEmitter
 * Purpose: Stage class rendering a CallGraph as a mermaid diagram.
 * Inputs: Graph, source, optional target method, render configuration
 * Outputs: DiagramResult or an error string
 * Theory of Operation: Calls jflow::Render under the Render timer; a RenderError
 *   becomes a false return with its message.
 */
#pragma once

#include <optional>
#include <string>

#include "jflow/metrics/metrics.h"
#include "jflow/model/call_graph.h"
#include "jflow/render/diagram_result.h"
#include "jflow/render/render_config.h"

namespace jflow {
namespace stages {

class DiagramEmitter : public metrics::Metrics {
 public:
  /*** Emit: Render the graph into out_result. */
  bool Emit(const model::CallGraph& graph, const std::string& src,
            const std::optional<std::string>& method, const render::RenderConfig& config,
            render::DiagramResult& out_result, std::string& err);
};

}  // namespace stages
}  // namespace jflow
