/***
 * Name: jflow::syntax::SyntaxTree
 * Purpose: Parse Java source with tree-sitter and expose the resulting tree.
 * Inputs: Java source text (UTF-8)
 * Outputs: Owned tree; root node; first error node
 * Theory of Operation: A parser is created per call and released on return; the
 *   tree outlives it. Failures to create the parser, install the grammar, or
 *   produce a tree are reported as exceptions::ParseError.
 */
#include "jflow/syntax/syntax_tree.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <tree_sitter/api.h>

#include "jflow/exceptions/parse_error.h"

extern "C" const TSLanguage* tree_sitter_java(void);

namespace jflow::syntax {

static std::optional<SyntaxNode> FindFirstError(const SyntaxNode& node) {
  if (node.IsError() || node.IsMissing()) {
    return node;
  }
  if (!node.HasError()) {
    return std::nullopt;
  }
  for (const auto& child : node.Children()) {
    if (auto found = FindFirstError(child)) {
      return found;
    }
  }
  return std::nullopt;
}

SyntaxTree SyntaxTree::Parse(std::string_view source) {
  if (source.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw exceptions::ParseError("source too large for the parser");
  }
  const std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(), &ts_parser_delete);
  if (!parser) {
    throw exceptions::ParseError("failed to create parser");
  }
  if (!ts_parser_set_language(parser.get(), tree_sitter_java())) {
    throw exceptions::ParseError("failed to set language");
  }
  TSTree* tree = ts_parser_parse_string(parser.get(), nullptr, source.data(),
                                        static_cast<std::uint32_t>(source.size()));
  if (tree == nullptr) {
    throw exceptions::ParseError("failed to parse source");
  }
  return SyntaxTree(tree);
}

SyntaxNode SyntaxTree::Root() const { return SyntaxNode{ts_tree_root_node(tree_.get())}; }

std::optional<SyntaxNode> SyntaxTree::FirstError() const { return FindFirstError(Root()); }

}  // namespace jflow::syntax
