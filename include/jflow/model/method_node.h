/***
 * Name: jflow::model::MethodNode
 * Purpose: One declared Java method as recorded in the method registry.
 * Inputs: Populated by the declaration collector
 * Outputs: Read-only record consumed by the renderer and serializers
 * Theory of Operation: Identity is the simple name only. A later declaration with
 *   the same name replaces an earlier one in the registry (overloads collapse).
 */
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jflow {
namespace model {

struct MethodNode {
  std::string name;
  std::pair<std::size_t, std::size_t> range{0, 0};  // start/end byte offsets of the declaration
  std::vector<std::string> modifiers;                // source order; annotations included
  std::string return_type;                           // empty when absent

  bool HasModifier(const std::string& token) const {
    for (const auto& modifier : modifiers) {
      if (modifier == token) {
        return true;
      }
    }
    return false;
  }
};

}  // namespace model
}  // namespace jflow
