/***
 * Name: jflow::driver::detail::HandleSwitch
 * Purpose: Handle simple boolean switches, help included.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Sets flags and returns Handled when a match occurs.
 */
#include "jflow/driver/cli_parse.h"

#include <string>

namespace jflow {
namespace driver {
namespace detail {

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "-h" || arg == "--help") {
    dst.show_help = true;
  } else if (arg == "--collapse") {
    dst.collapse = true;
  } else if (arg == "--source-ref") {
    dst.source_ref = true;
  } else if (arg == "--strict") {
    dst.strict = true;
  } else if (arg == "--no-default-ignores") {
    dst.default_ignores = false;
  } else if (arg == "--log-flow") {
    dst.log_flow = true;
  } else {
    return OptResult::NotMatched;
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
