/***
 * Name: jflow::render::DefaultIgnoredServices
 * Purpose: Receivers hidden from diagrams by default (console output).
 */
#include <set>
#include <string>

#include "jflow/render/render_config.h"

namespace jflow::render {

std::set<std::string> DefaultIgnoredServices() { return {"System.out", "System.err"}; }

}  // namespace jflow::render
