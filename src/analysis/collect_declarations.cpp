/***
 * Name: jflow::analysis::CollectDeclarations
 * Purpose: Build the method registry of a source unit.
 * Inputs: root node and source text
 * Outputs: DeclarationSet
 * Theory of Operation: Only type declarations and their bodies are descended
 *   into; a method_declaration child is recorded and not entered, so nested
 *   local classes inside method bodies are not collected.
 */
#include "jflow/analysis/declaration_collector.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jflow/support/text.h"

namespace jflow::analysis {

static bool IsTypeContainer(std::string_view kind) {
  return kind == "class_declaration" || kind == "class_body" ||
         kind == "interface_declaration" || kind == "interface_body" ||
         kind == "enum_declaration" || kind == "enum_body" ||
         kind == "enum_body_declarations" || kind == "record_declaration";
}

static syntax::SyntaxNode FindModifiers(const syntax::SyntaxNode& method) {
  auto modifiers = method.ChildByFieldName("modifiers");
  if (!modifiers.IsNull()) {
    return modifiers;
  }
  for (const auto& child : method.Children()) {
    if (child.Kind() == "modifiers") {
      return child;
    }
  }
  return syntax::SyntaxNode{};
}

static std::vector<std::string> ModifierTokens(const syntax::SyntaxNode& modifiers,
                                               std::string_view source) {
  std::vector<std::string> tokens;
  if (modifiers.IsNull()) {
    return tokens;
  }
  const auto children = modifiers.Children();
  if (children.empty()) {
    const auto text = support::Trim(modifiers.Text(source));
    if (!text.empty()) {
      tokens.emplace_back(text);
    }
    return tokens;
  }
  for (const auto& child : children) {
    const auto text = support::Trim(child.Text(source));
    if (!text.empty()) {
      tokens.emplace_back(text);
    }
  }
  return tokens;
}

static void RecordMethod(const syntax::SyntaxNode& method, std::string_view source,
                         DeclarationSet& out) {
  const auto name_node = method.ChildByFieldName("name");
  if (name_node.IsNull()) {
    return;
  }
  model::MethodNode node;
  node.name = std::string(support::Trim(name_node.Text(source)));
  if (node.name.empty()) {
    return;
  }
  node.range = {method.StartByte(), method.EndByte()};
  node.modifiers = ModifierTokens(FindModifiers(method), source);
  const auto type_node = method.ChildByFieldName("type");
  if (!type_node.IsNull()) {
    node.return_type = std::string(support::Trim(type_node.Text(source)));
  }
  out.declarations.push_back(Declaration{node.name, method});
  out.registry[node.name] = std::move(node);
}

static void Collect(const syntax::SyntaxNode& node, std::string_view source, DeclarationSet& out) {
  for (const auto& child : node.Children()) {
    const auto kind = child.Kind();
    if (kind == "method_declaration") {
      RecordMethod(child, source, out);
    } else if (IsTypeContainer(kind)) {
      Collect(child, source, out);
    }
  }
}

DeclarationSet CollectDeclarations(const syntax::SyntaxNode& root, std::string_view source) {
  DeclarationSet out;
  if (!root.IsNull()) {
    Collect(root, source, out);
  }
  return out;
}

}  // namespace jflow::analysis
