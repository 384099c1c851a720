/***
 * Name: jflow::syntax::SyntaxNode
 * Purpose: Value handle for one node of a tree-sitter Java syntax tree.
 * Inputs: A TSNode borrowed from a live SyntaxTree
 * Outputs: Kind string, byte range, field lookup, ordered children, 1-based positions
 * Theory of Operation: Thin non-owning wrapper over the tree-sitter C API. A node
 *   is only valid while the SyntaxTree it came from is alive.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <tree_sitter/api.h>

namespace jflow {
namespace syntax {

class SyntaxNode {
 public:
  SyntaxNode() = default;
  explicit SyntaxNode(TSNode node) : node_(node) {}

  bool IsNull() const;
  bool IsNamed() const;
  bool IsError() const;
  bool IsMissing() const;
  bool HasError() const;

  std::string_view Kind() const;
  std::size_t StartByte() const;
  std::size_t EndByte() const;
  /*** StartLine/StartColumn: 1-based source position of the first byte. */
  std::uint32_t StartLine() const;
  std::uint32_t StartColumn() const;

  /*** ChildByFieldName: Null node when the field is absent. */
  SyntaxNode ChildByFieldName(std::string_view field) const;
  std::vector<SyntaxNode> Children() const;
  std::vector<SyntaxNode> NamedChildren() const;

  /*** Text: Slice of source covered by this node; empty if out of range. */
  std::string_view Text(std::string_view source) const;

 private:
  TSNode node_{};
};

}  // namespace syntax
}  // namespace jflow
