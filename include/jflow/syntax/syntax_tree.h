/***
 * Name: jflow::syntax::SyntaxTree
 * Purpose: Own a parsed tree-sitter tree for one Java source unit.
 * Inputs: Java source text
 * Outputs: Root SyntaxNode; first error position for strict callers
 * Theory of Operation: Parse() builds a fresh parser per call, installs the Java
 *   grammar, parses the text, and hands ownership of the TSTree to the returned
 *   object. No parser state is shared between calls.
 */
#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <tree_sitter/api.h>

#include "jflow/syntax/syntax_node.h"

namespace jflow {
namespace syntax {

class SyntaxTree {
 public:
  /*** Parse: Throws exceptions::ParseError if no tree can be produced. */
  static SyntaxTree Parse(std::string_view source);

  SyntaxNode Root() const;

  /*** FirstError: Earliest ERROR or MISSING node in document order, if any. */
  std::optional<SyntaxNode> FirstError() const;

 private:
  explicit SyntaxTree(TSTree* tree) : tree_(tree, &ts_tree_delete) {}

  std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree_;
};

}  // namespace syntax
}  // namespace jflow
