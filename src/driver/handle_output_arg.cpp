/***
 * Name: jflow::driver::detail::HandleOutputArg
 * Purpose: Handle `-o <file>` and `--output=<file>`.
 * Inputs:
 *   - args: full argument vector
 *   - index: current index (advanced past the filename for the short form)
 *   - argc: total argument count
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Both forms require a non-empty filename; "-" keeps stdout.
 */
#include "jflow/driver/cli_parse.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace jflow {
namespace driver {
namespace detail {

auto HandleOutputArg(const std::vector<std::string>& args,
                     int& index,
                     int argc,
                     CliOptions& dst,
                     std::ostream& err) -> OptResult {
  const std::string& arg = args[static_cast<std::size_t>(index)];
  constexpr std::string_view kLong{"--output="};
  std::string value;
  if (arg == "-o") {
    if (index + 1 >= argc) {
      err << "jflow: error: missing filename after '-o'" << '\n';
      return OptResult::Error;
    }
    value = args[static_cast<std::size_t>(++index)];
  } else if (arg.rfind(kLong, 0) == 0U) {
    value = arg.substr(kLong.size());
  } else {
    return OptResult::NotMatched;
  }
  if (value.empty()) {
    err << "jflow: error: empty output filename" << '\n';
    return OptResult::Error;
  }
  dst.output = value;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
