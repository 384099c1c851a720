/***
 * Name: jflow (public API)
 * Purpose: The two entry points the rest of an application needs: build a call
 *   graph from Java source, and render a graph as a mermaid flowchart.
 * Inputs:
 *   - Parse: Java source text, ParseOptions
 *   - Render: graph, the same source, optional target method, RenderConfig
 * Outputs: model::CallGraph / render::DiagramResult
 * Theory of Operation: Both calls are pure. Each Parse builds its own tree and
 *   registry; each Render owns its node counter. Parse throws ParseError (or
 *   SyntaxError in strict mode); Render throws RenderError when the graph and the
 *   source disagree. Neither touches the metrics registry.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "jflow/model/call_graph.h"
#include "jflow/render/diagram_result.h"
#include "jflow/render/render_config.h"

namespace jflow {

struct ParseOptions {
  bool reject_syntax_errors{false};
};

model::CallGraph Parse(std::string_view source, const ParseOptions& options = {});

render::DiagramResult Render(const model::CallGraph& graph,
                             std::string_view source,
                             const std::optional<std::string>& method,
                             const render::RenderConfig& config);

}  // namespace jflow
