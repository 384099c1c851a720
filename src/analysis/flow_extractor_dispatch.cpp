/***
 * Name: jflow::analysis::detail::FlowExtractor::Extract
 * Purpose: Route a statement node to the matching extraction rule.
 */
#include <string_view>
#include <utility>

#include "jflow/analysis/detail/flow_extractor.h"

namespace jflow::analysis::detail {

void Append(model::FlowSequence& head, model::FlowSequence&& tail) {
  head.reserve(head.size() + tail.size());
  for (auto& step : tail) {
    head.push_back(std::move(step));
  }
}

model::FlowSequence FlowExtractor::Extract(const syntax::SyntaxNode& node) const {
  if (node.IsNull()) {
    return {};
  }
  const std::string_view kind = node.Kind();
  if (kind == "expression_statement" || kind == "local_variable_declaration" ||
      kind == "method_invocation") {
    return ExtractCalls(node);
  }
  if (kind == "return_statement") {
    return ExtractReturn(node);
  }
  if (kind == "if_statement") {
    return ExtractIf(node);
  }
  if (kind == "for_statement" || kind == "enhanced_for_statement" ||
      kind == "while_statement" || kind == "do_statement") {
    return ExtractLoop(node);
  }
  if (kind == "switch_expression" || kind == "switch_statement") {
    return ExtractSwitch(node);
  }
  // block and every unrecognized kind
  return ExtractChildren(node);
}

model::FlowSequence FlowExtractor::ExtractChildren(const syntax::SyntaxNode& node) const {
  model::FlowSequence out;
  for (const auto& child : node.NamedChildren()) {
    Append(out, Extract(child));
  }
  return out;
}

}  // namespace jflow::analysis::detail
