/***
 * Name: jflow::driver::BuildRenderConfig
 * Purpose: Map CLI switches onto render::RenderConfig.
 * Inputs: opts
 * Outputs: RenderConfig
 * Theory of Operation: Default console ignores are merged into the service set
 *   unless --no-default-ignores was given.
 */
#include "jflow/driver/app.h"

#include <set>
#include <string>
#include <vector>

#include "jflow/exceptions/config_error.h"

namespace jflow::driver {

static void AddNames(const std::vector<std::string>& names, const char* option,
                     std::set<std::string>& out) {
  for (const auto& name : names) {
    if (name.empty()) {
      throw exceptions::ConfigError(std::string("empty name given to '") + option + "'");
    }
    out.insert(name);
  }
}

auto BuildRenderConfig(const driver::CliOptions& opts) -> render::RenderConfig {
  render::RenderConfig config;
  if (opts.default_ignores) {
    config.ignored_service_names = render::DefaultIgnoredServices();
  }
  AddNames(opts.ignored_services, "--ignore-service", config.ignored_service_names);
  AddNames(opts.ignored_variables, "--ignore-var", config.ignored_variable_names);
  config.collapse_details = opts.collapse;
  config.show_source_reference = opts.source_ref;
  return config;
}

}  // namespace jflow::driver
