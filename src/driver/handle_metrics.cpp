/***
 * Name: jflow::driver::detail::HandleMetricsArg
 * Purpose: Handle --metrics and --metrics=json|text.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Bare --metrics means text. Either form enables collection,
 *   even when the format value is rejected.
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

auto HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  using Format = CliOptions::MetricsFormat;
  if (arg == "--metrics") {
    dst.metrics = true;
    dst.metrics_format = Format::Text;
    return OptResult::Handled;
  }
  static constexpr std::array<std::pair<std::string_view, Format>, 2> kFormats{{
      {"json", Format::Json},
      {"text", Format::Text},
  }};
  const OptResult result = ParseChoice(arg, "--metrics=", kFormats, "metrics format", dst.metrics_format, err);
  if (result != OptResult::NotMatched) {
    dst.metrics = true;
  }
  return result;
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
