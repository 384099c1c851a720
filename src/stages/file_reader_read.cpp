/***
 * Name: jflow::stages::FileReader::Read
 * Purpose: Load Java source from a path, or from stdin for "-", under the ReadFile phase.
 * Inputs:
 *   - path: file path or "-"
 * Outputs:
 *   - out_src: populated with contents on success
 *   - err: error message on failure
 * Theory of Operation: Dispatches to support::ReadStream or support::ReadFile and
 *   notes the byte count when metrics are on.
 */
#include "jflow/stages/file_reader.h"

#include "jflow/metrics/metrics.h"
#include "jflow/support/fs.h"

#include <iostream>
#include <string>

namespace jflow::stages {

auto FileReader::Read(const std::string& path, std::string& out_src, std::string& err) -> bool {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::ReadFile);
  const bool from_stdin = path == kStdinPath;
  const std::string name = from_stdin ? std::string{"<stdin>"} : path;
  const bool is_ok = from_stdin ? support::ReadStream(std::cin, name, out_src, err)
                                : support::ReadFile(path, out_src, err);
  if (is_ok) {
    metrics::Metrics::RecordNote("read " + std::to_string(out_src.size()) + " bytes from " + name);
  }
  return is_ok;
}

}  // namespace jflow::stages
