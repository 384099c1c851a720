/***
 * Name: jflow::observability::FlowGeometry
 * Purpose: Size summary of an analyzed unit for metrics output.
 * Inputs: model::CallGraph
 * Outputs: method count, total flow steps, deepest step nesting
 * Theory of Operation: Every step counts once, nested ones included. A top-level
 *   step has depth 1; each branch, loop body or case adds one level.
 */
#pragma once

#include <cstdint>

#include "jflow/model/call_graph.h"

namespace jflow {
namespace observability {

struct FlowGeometry {
  std::uint64_t methods{0};
  std::uint64_t steps{0};
  std::uint64_t max_depth{0};
};

FlowGeometry ComputeFlowGeometry(const model::CallGraph& graph);

}  // namespace observability
}  // namespace jflow
