/***
 * Name: jflow::analysis::CollectDeclarations
 * Purpose: Find every method declaration in a Java source unit.
 * Inputs:
 *   - root: syntax tree root (program node)
 *   - source: the text the tree was parsed from
 * Outputs: DeclarationSet with the method registry and the declaration nodes in
 *   source order for later flow extraction
 * Theory of Operation: Single recursive descent through type declarations and
 *   their bodies (class, interface, enum, record). Method bodies are not entered.
 *   A repeated simple name overwrites the earlier registry entry; both nodes stay
 *   in the declaration list.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "jflow/analysis/method_registry.h"
#include "jflow/syntax/syntax_node.h"

namespace jflow {
namespace analysis {

struct Declaration {
  std::string name;
  syntax::SyntaxNode node;
};

struct DeclarationSet {
  MethodRegistry registry;
  std::vector<Declaration> declarations;
};

DeclarationSet CollectDeclarations(const syntax::SyntaxNode& root, std::string_view source);

}  // namespace analysis
}  // namespace jflow
