/***
 * Name: jflow::serialize::WriteCallGraphJson
 * Purpose: JSON form of nodes, calls and flows (see header).
 */
#include "jflow/serialize/graph_json.h"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "jflow/support/text.h"

namespace jflow::serialize {

namespace {

void Str(std::ostream& out, std::string_view text) { out << '"' << support::JsonEscape(text) << '"'; }

void StrArray(std::ostream& out, const std::vector<std::string>& items) {
  out << '[';
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i != 0U) out << ", ";
    Str(out, items[i]);
  }
  out << ']';
}

void Sequence(std::ostream& out, const model::FlowSequence& steps);

void Position(std::ostream& out, std::size_t offset, std::uint32_t line) {
  out << R"(, "offset": )" << offset << R"(, "line": )" << line;
}

void Step(std::ostream& out, const model::FlowStep& step) {
  out << R"({"kind": ")" << model::to_string(step.kind()) << '"';
  if (const auto* call = step.as<model::CallStep>()) {
    out << R"(, "name": )"; Str(out, call->name);
    out << R"(, "is_external": )" << (call->is_external ? "true" : "false");
    out << R"(, "raw_text": )"; Str(out, call->raw_text);
    out << R"(, "receiver": )"; Str(out, call->receiver);
    Position(out, call->offset, call->line);
  } else if (const auto* decision = step.as<model::DecisionStep>()) {
    out << R"(, "label": )"; Str(out, decision->label);
    Position(out, decision->offset, decision->line);
    out << R"(, "yes_branch": )"; Sequence(out, decision->yes_branch);
    out << R"(, "no_branch": )"; Sequence(out, decision->no_branch);
  } else if (const auto* loop = step.as<model::LoopStep>()) {
    out << R"(, "label": )"; Str(out, loop->label);
    Position(out, loop->offset, loop->line);
    out << R"(, "body": )"; Sequence(out, loop->body);
  } else if (const auto* sw = step.as<model::SwitchStep>()) {
    out << R"(, "label": )"; Str(out, sw->label);
    Position(out, sw->offset, sw->line);
    out << R"(, "cases": [)";
    for (std::size_t i = 0; i < sw->cases.size(); ++i) {
      if (i != 0U) out << ", ";
      out << R"({"label": )"; Str(out, sw->cases[i].label);
      out << R"(, "steps": )"; Sequence(out, sw->cases[i].steps);
      out << '}';
    }
    out << ']';
  } else if (const auto* ret = step.as<model::ReturnStep>()) {
    out << R"(, "label": )"; Str(out, ret->label);
    Position(out, ret->offset, ret->line);
  }
  out << '}';
}

void Sequence(std::ostream& out, const model::FlowSequence& steps) {
  out << '[';
  for (std::size_t i = 0; i < steps.size(); ++i) {
    if (i != 0U) out << ", ";
    Step(out, steps[i]);
  }
  out << ']';
}

}  // namespace

void WriteCallGraphJson(const model::CallGraph& graph, std::ostream& out) {
  out << "{\n  \"nodes\": {";
  bool first = true;
  for (const auto& [name, node] : graph.nodes) {
    out << (first ? "\n    " : ",\n    ");
    first = false;
    Str(out, name);
    out << R"(: {"name": )"; Str(out, node.name);
    out << R"(, "range": [)" << node.range.first << ", " << node.range.second << ']';
    out << R"(, "modifiers": )"; StrArray(out, node.modifiers);
    out << R"(, "return_type": )"; Str(out, node.return_type);
    out << '}';
  }
  out << "\n  },\n  \"calls\": {";
  first = true;
  for (const auto& [name, callees] : graph.calls) {
    out << (first ? "\n    " : ",\n    ");
    first = false;
    Str(out, name);
    out << ": ";
    StrArray(out, callees);
  }
  out << "\n  },\n  \"flows\": {";
  first = true;
  for (const auto& [name, flow] : graph.flows) {
    out << (first ? "\n    " : ",\n    ");
    first = false;
    Str(out, name);
    out << ": ";
    Sequence(out, flow);
  }
  out << "\n  }\n}\n";
}

}  // namespace jflow::serialize
