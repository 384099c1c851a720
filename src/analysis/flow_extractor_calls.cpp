/***
 * Name: FlowExtractor::ExtractCalls / ExtractReturn
 * Purpose: Leaf statement rules.
 * Theory of Operation: Expression and declaration statements become one Call step
 *   per invocation found inside them. A return statement is a single Return step
 *   labelled with its own text; invocations inside it are not expanded.
 */
#include <utility>

#include "jflow/analysis/call_classifier.h"
#include "jflow/analysis/detail/flow_extractor.h"
#include "jflow/support/text.h"

namespace jflow::analysis::detail {

model::FlowSequence FlowExtractor::ExtractCalls(const syntax::SyntaxNode& node) const {
  model::FlowSequence out;
  for (auto& call : ClassifyCalls(node, source_, registry_)) {
    out.emplace_back(std::move(call));
  }
  return out;
}

model::FlowSequence FlowExtractor::ExtractReturn(const syntax::SyntaxNode& node) const {
  model::ReturnStep step;
  step.label = support::SanitizeLabel(support::Trim(node.Text(source_)));
  step.offset = node.StartByte();
  step.line = node.StartLine();
  model::FlowSequence out;
  out.emplace_back(std::move(step));
  return out;
}

}  // namespace jflow::analysis::detail
