/***
 * Name: jflow::analysis::detail::FlowExtractor
 * Purpose: Recursive statement walker producing FlowSequences.
 * Inputs: statement nodes of one method body
 * Outputs: FlowSequence per statement
 * Theory of Operation: Dispatches on node kind. Blocks concatenate, expression and
 *   declaration statements become Call steps, returns become one Return step,
 *   if/loop/switch become structured steps with recursively extracted payloads,
 *   and any other kind recurses into its named children.
 */
#pragma once

#include <string>
#include <string_view>

#include "jflow/analysis/method_registry.h"
#include "jflow/model/flow_step.h"
#include "jflow/syntax/syntax_node.h"

namespace jflow {
namespace analysis {
namespace detail {

class FlowExtractor {
 public:
  FlowExtractor(std::string_view source, const MethodRegistry& registry)
      : source_(source), registry_(registry) {}

  model::FlowSequence Extract(const syntax::SyntaxNode& node) const;

 private:
  model::FlowSequence ExtractChildren(const syntax::SyntaxNode& node) const;
  model::FlowSequence ExtractCalls(const syntax::SyntaxNode& node) const;
  model::FlowSequence ExtractReturn(const syntax::SyntaxNode& node) const;
  model::FlowSequence ExtractIf(const syntax::SyntaxNode& node) const;
  model::FlowSequence ExtractLoop(const syntax::SyntaxNode& node) const;
  model::FlowSequence ExtractSwitch(const syntax::SyntaxNode& node) const;

  std::string LoopLabel(const syntax::SyntaxNode& node) const;
  std::string CaseLabel(const syntax::SyntaxNode& group) const;

  std::string_view source_;
  const MethodRegistry& registry_;
};

/*** Append: Move every step of tail onto the end of head. */
void Append(model::FlowSequence& head, model::FlowSequence&& tail);

}  // namespace detail
}  // namespace analysis
}  // namespace jflow
