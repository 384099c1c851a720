/***
 * Name: jflow::render::detail::FlowRenderer
 * Purpose: Per-render state machine emitting nodes and edges for flow models.
 * Inputs: RenderConfig, an output stream, method nodes and their flows
 * Outputs: mermaid statements written to the stream
 * Theory of Operation: Each Render* call takes the incoming frontier (nodes whose
 *   outgoing edge is not drawn yet) and a pending edge label, writes its nodes,
 *   connects the frontier, and returns the new frontier. A sequence hands its
 *   pending label to steps until one of them changes the frontier.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "jflow/model/flow_step.h"
#include "jflow/model/method_node.h"
#include "jflow/render/render_config.h"

namespace jflow {
namespace render {
namespace detail {

using Frontier = std::vector<std::string>;
using EdgeLabel = std::optional<std::string>;

class FlowRenderer {
 public:
  FlowRenderer(const RenderConfig& config, std::ostream& out) : config_(config), out_(out) {}

  void RenderMethod(const model::MethodNode& method, const model::FlowSequence& flow);
  void RenderCollapsed(const model::MethodNode& method);

 private:
  Frontier RenderSequence(const model::FlowSequence& steps, Frontier frontier, EdgeLabel label);
  Frontier RenderStep(const model::FlowStep& step, const Frontier& frontier, const EdgeLabel& label);
  Frontier RenderCall(const model::CallStep& call, const Frontier& frontier, const EdgeLabel& label);
  Frontier RenderDecision(const model::DecisionStep& decision, const Frontier& frontier, const EdgeLabel& label);
  Frontier RenderLoop(const model::LoopStep& loop, const Frontier& frontier, const EdgeLabel& label);
  Frontier RenderSwitch(const model::SwitchStep& step, const Frontier& frontier, const EdgeLabel& label);
  Frontier RenderReturn(const model::ReturnStep& step, const Frontier& frontier, const EdgeLabel& label);

  std::string NextId();
  std::string DisplayLabel(std::string_view text, std::uint32_t line) const;
  void EmitNode(const std::string& id, std::string_view open, std::string_view label,
                std::string_view close, std::string_view style);
  void EmitClick(const std::string& id, std::size_t offset);
  void EmitEdges(const Frontier& from, const std::string& to, const EdgeLabel& label);

  const RenderConfig& config_;
  std::ostream& out_;
  std::size_t counter_{0};
  std::size_t subgraph_counter_{0};
};

/*** EscapeEdgeLabel: Encode '|' as the entity `#124;` so it cannot close a `-->|..|` label. */
std::string EscapeEdgeLabel(std::string_view label);

/*** MergeFrontier: Append `more` to `into`, skipping ids already present. */
void MergeFrontier(Frontier& into, const Frontier& more);

}  // namespace detail
}  // namespace render
}  // namespace jflow
