/***
 * Name: jflow::driver::detail::HandleEmitArg
 * Purpose: Handle --emit=mermaid|graph|services.
 * Inputs: arg, dst, err
 * Outputs: OptResult indicating match and success/failure
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

auto HandleEmitArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  using Kind = CliOptions::EmitKind;
  static constexpr std::array<std::pair<std::string_view, Kind>, 3> kKinds{{
      {"mermaid", Kind::Mermaid},
      {"graph", Kind::Graph},
      {"services", Kind::Services},
  }};
  return ParseChoice(arg, "--emit=", kKinds, "emit kind", dst.emit, err);
}

}  // namespace detail
}  // namespace driver
}  // namespace jflow
