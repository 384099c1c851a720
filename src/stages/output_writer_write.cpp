/***
 * Name: jflow::stages::OutputWriter::Write
 * Purpose: Deliver output and record the WriteOutput phase.
 * Inputs: path, data, console stream
 * Outputs: true on success; err set on failure
 */
#include "jflow/stages/output_writer.h"

#include <ostream>
#include <string>

#include "jflow/support/fs.h"

namespace jflow::stages {

auto OutputWriter::Write(const std::string& path, const std::string& data, std::ostream& console,
                         std::string& err) -> bool {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::WriteOutput);
  if (path.empty() || path == "-") {
    console << data;
    console.flush();
    if (!console) {
      err = "failed to write output";
      return false;
    }
    return true;
  }
  return support::WriteFile(path, data, err);
}

}  // namespace jflow::stages
