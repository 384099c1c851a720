/***
 * Name: jflow::driver::detail::HandleUnknownOrPositional
 * Purpose: Reject unmatched dashed tokens; record everything else as an input path.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult::Error for unknown option, OptResult::Handled otherwise.
 * Theory of Operation: Last entry in the RunHandlers table. A lone "-" names stdin
 *   and empty tokens are skipped.
 */
#include "jflow/driver/cli_parse.h"

#include <ostream>
#include <string>

namespace jflow {
namespace driver {
namespace detail {

auto HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  if (arg.empty()) {
    return OptResult::Handled;
  }
  if (arg[0] == '-' && arg != "-") {
    err << "jflow: error: unknown option '" << arg << "'" << '\n';
    return OptResult::Error;
  }
  dst.inputs.push_back(arg);
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
