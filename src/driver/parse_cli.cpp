/***
 * Name: jflow::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector (null entries read as empty)
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Runs the handler table per token until "--", after which
 *   every token is an input. Help stops parsing immediately.
 */
#include "jflow/driver/cli.h"
#include "jflow/driver/cli_parse.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace jflow::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  dst = CliOptions{};

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    const char* arg_ptr = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    args.emplace_back(arg_ptr == nullptr ? "" : arg_ptr);
  }

  bool options_done = false;
  for (int arg_index = 1; arg_index < argc; ++arg_index) {
    const std::string& arg = args[static_cast<std::size_t>(arg_index)];
    if (options_done) {
      dst.inputs.push_back(arg);
      continue;
    }
    if (arg == "--") {
      options_done = true;
      continue;
    }
    if (detail::RunHandlers(args, arg_index, argc, dst, err) == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help) {
      return true;
    }
  }

  if (dst.inputs.empty()) {
    err << "jflow: error: no input files" << '\n';
    return false;
  }
  if (dst.inputs.size() != 1) {
    err << "jflow: error: exactly one input file is supported" << '\n';
    return false;
  }
  return true;
}

}  // namespace jflow::driver
