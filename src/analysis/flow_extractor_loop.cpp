/***
 * Name: FlowExtractor::ExtractLoop / LoopLabel
 * Purpose: Loop statements become a Loop step wrapping the extracted body.
 * Theory of Operation: Labels by loop kind:
 *   while       -> "while <cond>"
 *   do          -> "do...while <cond>"
 *   for         -> "for (...)"
 *   for-each    -> "for (<name> : <value>)"
 *   Labels over 60 bytes are cut to 57 plus "...".
 */
#include <string>
#include <string_view>
#include <utility>

#include "jflow/analysis/detail/flow_extractor.h"
#include "jflow/support/text.h"

namespace jflow::analysis::detail {

namespace {
constexpr std::size_t kLoopLabelLimit = 60;
constexpr std::size_t kLoopLabelKeep = 57;
}  // namespace

std::string FlowExtractor::LoopLabel(const syntax::SyntaxNode& node) const {
  const std::string_view kind = node.Kind();
  const auto condition_text = [&]() -> std::string {
    const auto condition = node.ChildByFieldName("condition");
    if (condition.IsNull()) {
      return "(...)";
    }
    return std::string(support::Trim(condition.Text(source_)));
  };
  if (kind == "while_statement") {
    return "while " + condition_text();
  }
  if (kind == "do_statement") {
    return "do...while " + condition_text();
  }
  if (kind == "enhanced_for_statement") {
    const auto name = node.ChildByFieldName("name");
    const auto value = node.ChildByFieldName("value");
    if (name.IsNull() || value.IsNull()) {
      return "for (...)";
    }
    std::string label = "for (";
    label += support::Trim(name.Text(source_));
    label += " : ";
    label += support::Trim(value.Text(source_));
    label += ")";
    return label;
  }
  return "for (...)";
}

model::FlowSequence FlowExtractor::ExtractLoop(const syntax::SyntaxNode& node) const {
  model::LoopStep loop;
  loop.label = support::TruncateLabel(support::SanitizeLabel(LoopLabel(node)), kLoopLabelLimit,
                                      kLoopLabelKeep);
  loop.offset = node.StartByte();
  loop.line = node.StartLine();
  loop.body = Extract(node.ChildByFieldName("body"));
  model::FlowSequence out;
  out.emplace_back(std::move(loop));
  return out;
}

}  // namespace jflow::analysis::detail
