/***
 * Name: jflow::driver::WriteFileOrReport
 * Purpose: Deliver the emitted artifact and report a failed write.
 * Inputs:
 *   - path: destination path ("" or "-" for `out`)
 *   - data: artifact text
 *   - out: console stream for stdout delivery
 *   - diag: receives "jflow: error: <detail>" on failure
 * Outputs:
 *   - bool: true on success
 * Theory of Operation: Delegates to stages::OutputWriter so the write is timed.
 */
#include "jflow/driver/app.h"
#include "jflow/stages/output_writer.h"

#include <ostream>
#include <string>

namespace jflow::driver {

auto WriteFileOrReport(const std::string& path, const std::string& data, std::ostream& out, std::ostream& diag)
    -> bool {
  std::string detail;
  if (stages::OutputWriter::Write(path, data, out, detail)) {
    return true;
  }
  diag << "jflow: error: " << detail << '\n';
  return false;
}

}  // namespace jflow::driver
