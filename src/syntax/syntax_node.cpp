/***
 * Name: jflow::syntax::SyntaxNode
 * Purpose: Accessors over the tree-sitter node API.
 * Theory of Operation: Each accessor forwards to the matching ts_node_* call;
 *   rows and columns are converted from 0-based to 1-based.
 */
#include "jflow/syntax/syntax_node.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <tree_sitter/api.h>

namespace jflow::syntax {

bool SyntaxNode::IsNull() const { return ts_node_is_null(node_); }

bool SyntaxNode::IsNamed() const { return !IsNull() && ts_node_is_named(node_); }

bool SyntaxNode::IsError() const { return !IsNull() && Kind() == "ERROR"; }

bool SyntaxNode::IsMissing() const { return !IsNull() && ts_node_is_missing(node_); }

bool SyntaxNode::HasError() const { return !IsNull() && ts_node_has_error(node_); }

std::string_view SyntaxNode::Kind() const {
  if (IsNull()) {
    return {};
  }
  return std::string_view{ts_node_type(node_)};
}

std::size_t SyntaxNode::StartByte() const { return IsNull() ? 0U : ts_node_start_byte(node_); }

std::size_t SyntaxNode::EndByte() const { return IsNull() ? 0U : ts_node_end_byte(node_); }

std::uint32_t SyntaxNode::StartLine() const { return IsNull() ? 0U : ts_node_start_point(node_).row + 1U; }

std::uint32_t SyntaxNode::StartColumn() const {
  return IsNull() ? 0U : ts_node_start_point(node_).column + 1U;
}

SyntaxNode SyntaxNode::ChildByFieldName(std::string_view field) const {
  if (IsNull()) {
    return SyntaxNode{};
  }
  return SyntaxNode{ts_node_child_by_field_name(node_, field.data(), static_cast<std::uint32_t>(field.size()))};
}

std::vector<SyntaxNode> SyntaxNode::Children() const {
  std::vector<SyntaxNode> out;
  if (IsNull()) {
    return out;
  }
  const std::uint32_t count = ts_node_child_count(node_);
  out.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    out.emplace_back(ts_node_child(node_, i));
  }
  return out;
}

std::vector<SyntaxNode> SyntaxNode::NamedChildren() const {
  std::vector<SyntaxNode> out;
  if (IsNull()) {
    return out;
  }
  const std::uint32_t count = ts_node_named_child_count(node_);
  out.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    out.emplace_back(ts_node_named_child(node_, i));
  }
  return out;
}

std::string_view SyntaxNode::Text(std::string_view source) const {
  const std::size_t start = StartByte();
  const std::size_t end = EndByte();
  if (IsNull() || start > end || end > source.size()) {
    return {};
  }
  return source.substr(start, end - start);
}

}  // namespace jflow::syntax
