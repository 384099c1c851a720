/***
 * Name: FlowRenderer emit helpers
 * Purpose: Node ids, label decoration and the three mermaid statement forms
 *   (node, click, edge).
 */
#include <string>
#include <string_view>

#include "jflow/render/detail/flow_renderer.h"
#include "jflow/support/text.h"

namespace jflow::render::detail {

void MergeFrontier(Frontier& into, const Frontier& more) {
  for (const auto& id : more) {
    bool present = false;
    for (const auto& existing : into) {
      if (existing == id) {
        present = true;
        break;
      }
    }
    if (!present) {
      into.push_back(id);
    }
  }
}

std::string FlowRenderer::NextId() { return "N" + std::to_string(++counter_); }

std::string FlowRenderer::DisplayLabel(std::string_view text, std::uint32_t line) const {
  std::string label = support::SanitizeLabel(text);
  if (config_.show_source_reference) {
    label += " (L" + std::to_string(line) + ")";
  }
  return label;
}

void FlowRenderer::EmitNode(const std::string& id, std::string_view open, std::string_view label,
                            std::string_view close, std::string_view style) {
  out_ << "    " << id << open << '"' << label << '"' << close;
  if (!style.empty()) {
    out_ << ":::" << style;
  }
  out_ << '\n';
}

void FlowRenderer::EmitClick(const std::string& id, std::size_t offset) {
  out_ << "    click " << id << " call onNodeClick(\"offset-" << offset << "\") \"Scroll to source\"\n";
}

std::string EscapeEdgeLabel(std::string_view label) {
  std::string out;
  out.reserve(label.size());
  for (const char ch : label) {
    if (ch == '|') {
      out += "#124;";
    } else {
      out += ch;
    }
  }
  return out;
}

void FlowRenderer::EmitEdges(const Frontier& from, const std::string& to, const EdgeLabel& label) {
  bool first = true;
  for (const auto& id : from) {
    out_ << "    " << id;
    if (first && label) {
      out_ << " -->|" << EscapeEdgeLabel(*label) << "| ";
    } else {
      out_ << " --> ";
    }
    out_ << to << '\n';
    first = false;
  }
}

}  // namespace jflow::render::detail
