/***
 * Name: jflow::driver::FormatServices
 * Purpose: Text form of the external service list for --emit=services.
 */
#include "jflow/driver/app.h"

#include <string>
#include <vector>

namespace jflow::driver {

auto FormatServices(const std::vector<std::string>& services) -> std::string {
  std::string out;
  for (const auto& service : services) {
    out += service;
    out += '\n';
  }
  return out;
}

}  // namespace jflow::driver
