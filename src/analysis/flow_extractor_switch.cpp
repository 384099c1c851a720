/***
 * Name: FlowExtractor::ExtractSwitch / CaseLabel
 * Purpose: Switch statements and expressions become a Switch step with one case
 *   per case group, in source order.
 * Theory of Operation: Both classic groups (`case 1: case 2: ...`) and arrow rules
 *   (`case 1 ->`) are cases. A group's label joins its switch labels with ", "
 *   and is cut to 27 bytes plus "..." when over 30. Case steps are the extracted
 *   non-label children.
 */
#include <string>
#include <string_view>
#include <utility>

#include "jflow/analysis/detail/flow_extractor.h"
#include "jflow/support/text.h"

namespace jflow::analysis::detail {

namespace {
constexpr std::size_t kCaseLabelLimit = 30;
constexpr std::size_t kCaseLabelKeep = 27;
}  // namespace

std::string FlowExtractor::CaseLabel(const syntax::SyntaxNode& group) const {
  std::string label;
  for (const auto& child : group.NamedChildren()) {
    if (child.Kind() != "switch_label") {
      continue;
    }
    const auto text = support::Trim(child.Text(source_));
    if (text.empty()) {
      continue;
    }
    if (!label.empty()) {
      label += ", ";
    }
    label += text;
  }
  if (label.empty()) {
    label = "case";
  }
  return support::TruncateLabel(support::SanitizeLabel(label), kCaseLabelLimit, kCaseLabelKeep);
}

model::FlowSequence FlowExtractor::ExtractSwitch(const syntax::SyntaxNode& node) const {
  model::SwitchStep step;
  const auto condition = node.ChildByFieldName("condition");
  if (condition.IsNull()) {
    step.label = "switch ...";
  } else {
    step.label = "switch " + support::SanitizeLabel(support::Trim(condition.Text(source_)));
  }
  step.offset = node.StartByte();
  step.line = node.StartLine();

  const auto body = node.ChildByFieldName("body");
  if (!body.IsNull()) {
    for (const auto& group : body.NamedChildren()) {
      const std::string_view kind = group.Kind();
      if (kind != "switch_block_statement_group" && kind != "switch_rule") {
        continue;
      }
      model::SwitchCase entry;
      entry.label = CaseLabel(group);
      for (const auto& child : group.NamedChildren()) {
        if (child.Kind() != "switch_label") {
          Append(entry.steps, Extract(child));
        }
      }
      step.cases.push_back(std::move(entry));
    }
  }
  model::FlowSequence out;
  out.emplace_back(std::move(step));
  return out;
}

}  // namespace jflow::analysis::detail
