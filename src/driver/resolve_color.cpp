/***
 * Name: jflow::driver::ResolveColor
 * Purpose: Decide whether diagnostics on stderr are colored.
 */
#include "jflow/driver/diagnostic.h"

#include <unistd.h>

namespace jflow::driver {

bool ResolveColor(CliOptions::ColorMode mode) {
  if (mode == CliOptions::ColorMode::Always) { return true; }
  if (mode == CliOptions::ColorMode::Never) { return false; }
  constexpr int kStderrFd = 2;
  return (isatty(kStderrFd) != 0) || UseEnvColor();
}

}  // namespace jflow::driver
