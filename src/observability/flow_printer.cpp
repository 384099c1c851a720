/***
 * Name: jflow::observability::FlowPrinter
 * Purpose: Text rendering of flow models (see header).
 */
#include "jflow/observability/flow_printer.h"

#include <cstddef>
#include <string>

namespace jflow::observability {

std::string FlowPrinter::print(const model::CallGraph& graph) {
  reset();
  for (const auto& [name, node] : graph.nodes) {
    std::string header = "Method name=" + name;
    if (!node.return_type.empty()) header += ", ret=" + node.return_type;
    if (!node.modifiers.empty()) {
      header += ", modifiers=";
      for (std::size_t i = 0; i < node.modifiers.size(); ++i) {
        if (i != 0U) header += " ";
        header += node.modifiers[i];
      }
    }
    line(header);
    depth_++;
    const auto calls = graph.calls.find(name);
    if (calls != graph.calls.end() && !calls->second.empty()) {
      std::string callees = "Calls:";
      for (const auto& callee : calls->second) callees += " " + callee;
      line(callees);
    }
    const auto flow = graph.flows.find(name);
    if (flow != graph.flows.end()) sequence(flow->second);
    depth_--;
  }
  return ss_.str();
}

std::string FlowPrinter::print(const model::FlowSequence& steps) {
  reset();
  sequence(steps);
  return ss_.str();
}

void FlowPrinter::sequence(const model::FlowSequence& steps) {
  for (const auto& s : steps) step(s);
}

void FlowPrinter::step(const model::FlowStep& s) {
  if (const auto* call = s.as<model::CallStep>()) {
    line(std::string(call->is_external ? "ExternalCall " : "InternalCall ") + call->name +
         (call->receiver.empty() ? "" : " receiver=" + call->receiver) + " @L" + std::to_string(call->line));
  } else if (const auto* decision = s.as<model::DecisionStep>()) {
    line("Decision " + decision->label + " @L" + std::to_string(decision->line));
    depth_++;
    if (!decision->yes_branch.empty()) { line("Yes:"); depth_++; sequence(decision->yes_branch); depth_--; }
    if (!decision->no_branch.empty()) { line("No:"); depth_++; sequence(decision->no_branch); depth_--; }
    depth_--;
  } else if (const auto* loop = s.as<model::LoopStep>()) {
    line("Loop " + loop->label + " @L" + std::to_string(loop->line));
    depth_++; sequence(loop->body); depth_--;
  } else if (const auto* sw = s.as<model::SwitchStep>()) {
    line("Switch " + sw->label + " @L" + std::to_string(sw->line));
    depth_++;
    for (const auto& entry : sw->cases) { line("Case " + entry.label + ":"); depth_++; sequence(entry.steps); depth_--; }
    depth_--;
  } else if (const auto* ret = s.as<model::ReturnStep>()) {
    line("Return " + ret->label + " @L" + std::to_string(ret->line));
  }
}

}  // namespace jflow::observability
