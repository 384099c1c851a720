/***
 * Name: jflow::driver::PrintUsage
 * Purpose: Print CLI usage information for jflow.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "jflow/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace jflow::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"jflow"};
  }
  const char* last_slash = std::strrchr(path, '/');
#ifdef _WIN32
  const char* last_backslash = std::strrchr(path, '\\');
  if (last_backslash != nullptr && (last_slash == nullptr || last_backslash > last_slash)) {
    last_slash = last_backslash;
  }
#endif
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] <file.java | ->" << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help               Print this help and exit" << '\n'
      << "  -o <file>, --output=<file>" << '\n'
      << "                           Write the result to <file> (default: stdout)" << '\n'
      << "  -m <name>, --method=<name>" << '\n'
      << "                           Render only this method (default: public surface)" << '\n'
      << "  --emit=mermaid|graph|services" << '\n'
      << "                           Output kind (default: mermaid)" << '\n'
      << "  --ignore-var <name>      Hide calls on this receiver variable (repeatable)" << '\n'
      << "  --ignore-service <name>  Hide calls on this service (repeatable)" << '\n'
      << "  --no-default-ignores     Show System.out / System.err calls" << '\n'
      << "  --collapse               One node per method, no bodies (without -m)" << '\n'
      << "  --source-ref             Append (L<line>) to node labels" << '\n'
      << "  --strict                 Reject source containing syntax errors" << '\n'
      << "  --metrics[=json|text]    Print run metrics (default: text; stderr when output is stdout)" << '\n'
      << "  --color=auto|always|never Color diagnostics (env JFLOW_COLOR for auto)" << '\n'
      << "  --log-flow               Write flow models to <log-path>/<time>-flow.log" << '\n'
      << "  --log-path=<dir>         Directory for log files (default: .)" << '\n'
      << "  --                       End of options" << '\n'
      << '\n'
      << "An input of '-' reads the source from stdin." << '\n';
}

}  // namespace jflow::driver
