/***
 * Name: jflow::driver::UseEnvColor
 * Purpose: Read the JFLOW_COLOR environment switch.
 */
#include "jflow/driver/diagnostic.h"

#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace jflow::driver {

static bool EqualsCi(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const auto lhs_ch = static_cast<unsigned char>(lhs[i]);
    const auto rhs_ch = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(lhs_ch) != std::tolower(rhs_ch)) { return false; }
  }
  return true;
}

static bool IsTrueValue(const char* str_val) {
  if (str_val == nullptr) { return false; }
  const std::string_view value{str_val, std::strlen(str_val)};
  return value == "1" || EqualsCi(value, "true") || EqualsCi(value, "yes");
}

bool UseEnvColor() { return IsTrueValue(std::getenv("JFLOW_COLOR")); }

}  // namespace jflow::driver
