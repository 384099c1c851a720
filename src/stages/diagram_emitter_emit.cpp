/***
 * Name: jflow::stages::DiagramEmitter::Emit
 * Purpose: Render a call graph and record the Render phase.
 * Inputs: graph, src, method, config
 * Outputs:
 *   - out_result: diagram text and external services on success
 *   - err: message on failure
 * Theory of Operation: Notes the number of external services discovered.
 */
#include "jflow/stages/diagram_emitter.h"

#include <optional>
#include <string>

#include "jflow/exceptions/render_error.h"
#include "jflow/jflow.h"

namespace jflow::stages {

auto DiagramEmitter::Emit(const model::CallGraph& graph, const std::string& src,
                          const std::optional<std::string>& method,
                          const render::RenderConfig& config, render::DiagramResult& out_result,
                          std::string& err) -> bool {
  metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Render);
  try {
    out_result = jflow::Render(graph, src, method, config);
  } catch (const exceptions::RenderError& ex) {
    err = ex.what();
    return false;
  }
  metrics::Metrics::RecordNote("external services: " + std::to_string(out_result.external_services.size()));
  return true;
}

}  // namespace jflow::stages
