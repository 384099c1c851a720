/***
 * Name: jflow::driver::detail::HandleColorArg
 * Purpose: Handle --color=auto|always|never.
 * Inputs: arg, dst, err
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Auto defers to the environment (see ResolveColor).
 */
#include "jflow/driver/cli_parse.h"

#include <array>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace jflow {
namespace driver {
namespace detail {

auto HandleColorArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  using Mode = CliOptions::ColorMode;
  static constexpr std::array<std::pair<std::string_view, Mode>, 3> kModes{{
      {"auto", Mode::Auto},
      {"always", Mode::Always},
      {"never", Mode::Never},
  }};
  return ParseChoice(arg, "--color=", kModes, "color mode", dst.color, err);
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
