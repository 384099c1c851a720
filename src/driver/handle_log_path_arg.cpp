/***
 * Name: jflow::driver::detail::HandleLogPathArg
 * Purpose: Handle --log-path=<dir>.
 * Inputs: arg, dst, err
 * Outputs: OptResult indicating match and success/failure
 */
#include "jflow/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <string_view>

namespace jflow {
namespace driver {
namespace detail {

auto HandleLogPathArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  constexpr std::string_view kPrefix{"--log-path="};
  if (arg.rfind(kPrefix, 0) != 0U) {
    return OptResult::NotMatched;
  }
  dst.log_path = arg.substr(kPrefix.size());
  if (dst.log_path.empty()) {
    err << "jflow: error: empty directory given to '--log-path'" << '\n';
    return OptResult::Error;
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
