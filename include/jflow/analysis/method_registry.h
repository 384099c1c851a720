/***
 * Name: jflow::analysis::MethodRegistry
 * Purpose: Name-keyed registry of declared methods shared by the analysis passes.
 */
#pragma once

#include <map>
#include <string>

#include "jflow/model/method_node.h"

namespace jflow {
namespace analysis {

using MethodRegistry = std::map<std::string, model::MethodNode>;

}  // namespace analysis
}  // namespace jflow
