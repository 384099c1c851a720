/***
 * Name: jflow::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch. Switches (help included) run first so
 *   help wins over later malformed tokens; the last handler captures unknown/positional.
 */
#include "jflow/driver/cli_parse.h"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace jflow {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args,
                 int& index,
                 int argc,
                 CliOptions& dst,
                 std::ostream& err) -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;
  const std::string kIgnoreVar{"--ignore-var"};
  const std::string kIgnoreService{"--ignore-service"};

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleSwitch(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleMetricsArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) { return HandleOutputArg(args, idx, argc, dst, err); }},
      HandlerFn{[&](int& idx) { return HandleMethodArg(args, idx, argc, dst, err); }},
      HandlerFn{[&](int& idx) { return HandleEmitArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) {
        const std::string& current = args[static_cast<std::size_t>(idx)];
        const NameListParams params{kIgnoreVar, args, idx, argc, dst.ignored_variables, err};
        return HandleNameListArg(current, params);
      }},
      HandlerFn{[&](int& idx) {
        const std::string& current = args[static_cast<std::size_t>(idx)];
        const NameListParams params{kIgnoreService, args, idx, argc, dst.ignored_services, err};
        return HandleNameListArg(current, params);
      }},
      HandlerFn{[&](int& idx) { return HandleColorArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) { return HandleLogPathArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) {
        return HandleUnknownOrPositional(args[static_cast<std::size_t>(idx)], dst, err);
      }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result != OptResult::NotMatched) {
      return result;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
