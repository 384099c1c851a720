/***
 * Name: jflow::driver::detail::HandleMethodArg
 * Purpose: Handle -m <name> and --method=<name>.
 * Inputs: args, index (advanced for -m), argc, dst, err
 * Outputs: OptResult indicating match and success/failure
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

auto HandleMethodArg(const std::vector<std::string>& args,
                     int& index,
                     int argc,
                     CliOptions& dst,
                     std::ostream& err) -> OptResult {
  const std::string& arg = args[static_cast<std::size_t>(index)];
  std::string value;
  constexpr std::string_view kPrefix{"--method="};
  if (arg == "-m") {
    if (index + 1 >= argc) {
      err << "jflow: error: missing method name after '-m'" << '\n';
      return OptResult::Error;
    }
    ++index;
    value = args[static_cast<std::size_t>(index)];
  } else if (arg.rfind(kPrefix, 0) == 0U) {
    value = arg.substr(kPrefix.size());
  } else {
    return OptResult::NotMatched;
  }
  if (value.empty()) {
    err << "jflow: error: empty method name" << '\n';
    return OptResult::Error;
  }
  dst.method = value;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
