/***
 * Name: jflow::driver::detail::HandleNameListArg
 * Purpose: Handle repeatable name options: --opt <val> or --opt=<val>.
 * Inputs:
 *   - arg: current argument string
 *   - long_opt: option name (e.g., "--ignore-var")
 *   - args, index, argc: argument vector and cursor (advanced for the spaced form)
 *   - out: list to append the parsed value
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Supports both forms in a single helper. An empty value is
 *   recorded as-is and rejected later by BuildRenderConfig.
 */
#include "jflow/driver/cli_parse.h"

#include <cstddef>
#include <string>
#include <vector>

namespace jflow {
namespace driver {
namespace detail {

auto HandleNameListArg(const std::string& arg, const NameListParams& params) -> OptResult {
  if (arg == params.long_opt) {
    if (params.index + 1 >= params.argc) {
      params.err << "jflow: error: missing name after '" << params.long_opt << "'" << '\n';
      return OptResult::Error;
    }
    ++params.index;
    params.out.emplace_back(params.args[static_cast<std::size_t>(params.index)]);
    return OptResult::Handled;
  }
  const std::string prefix = params.long_opt + "=";
  if (arg.rfind(prefix, 0) == 0U) {
    params.out.emplace_back(arg.substr(prefix.size()));
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
