/***
 * Name: jflow::serialize::WriteCallGraphJson
 * Purpose: Serialize a CallGraph for consumption by a UI layer.
 * Inputs: graph, destination stream
 * Outputs: JSON object {"nodes": {...}, "calls": {...}, "flows": {...}}
 * Theory of Operation: Hand-written writer. Keys follow the graph's map order, so
 *   output is deterministic. Flow steps are objects tagged by "kind" with nested
 *   arrays for branches, bodies and cases.
 */
#pragma once

#include <ostream>

#include "jflow/model/call_graph.h"

namespace jflow {
namespace serialize {

void WriteCallGraphJson(const model::CallGraph& graph, std::ostream& out);

}  // namespace serialize
}  // namespace jflow
