/***
 * Name: FlowExtractor::ExtractIf
 * Purpose: Turn an if statement into calls of its condition followed by a Decision.
 * Theory of Operation: The condition keeps its parentheses in the label. An
 *   else-if chain nests as a Decision inside the no branch.
 */
#include <utility>

#include "jflow/analysis/call_classifier.h"
#include "jflow/analysis/detail/flow_extractor.h"
#include "jflow/support/text.h"

namespace jflow::analysis::detail {

model::FlowSequence FlowExtractor::ExtractIf(const syntax::SyntaxNode& node) const {
  model::FlowSequence out;
  const auto condition = node.ChildByFieldName("condition");
  model::DecisionStep decision;
  if (condition.IsNull()) {
    decision.label = "(...)";
    decision.offset = node.StartByte();
    decision.line = node.StartLine();
  } else {
    out = ExtractCalls(condition);
    decision.label = support::SanitizeLabel(support::Trim(condition.Text(source_)));
    decision.offset = condition.StartByte();
    decision.line = condition.StartLine();
  }
  decision.yes_branch = Extract(node.ChildByFieldName("consequence"));
  decision.no_branch = Extract(node.ChildByFieldName("alternative"));
  out.emplace_back(std::move(decision));
  return out;
}

}  // namespace jflow::analysis::detail
