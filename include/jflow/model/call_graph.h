/***
 * Name: jflow::model::CallGraph
 * Purpose: Assembled analysis result for one Java source unit.
 * Inputs: Built once by jflow::Parse
 * Outputs: Method registry, caller->callee adjacency, per-method flow models
 * Theory of Operation: Ordered maps keyed by method name keep iteration (and so
 *   serialization and rendering) deterministic. Read-only after construction.
 */
#pragma once

#include <map>
#include <string>
#include <vector>

#include "jflow/model/flow_step.h"
#include "jflow/model/method_node.h"

namespace jflow {
namespace model {

struct CallGraph {
  std::map<std::string, MethodNode> nodes;
  std::map<std::string, std::vector<std::string>> calls;  // duplicates kept, call order
  std::map<std::string, FlowSequence> flows;
};

}  // namespace model
}  // namespace jflow
