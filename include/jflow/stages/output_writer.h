/***
 * Name: jflow::stages::OutputWriter
 * Purpose: Stage class delivering the final artifact to a file or stdout.
 * Inputs: Destination path ("" or "-" means stdout) and data
 * Outputs: true on success, error string on failure
 * Theory of Operation: Wraps support::WriteFile under the WriteOutput timer.
 */
#pragma once

#include <ostream>
#include <string>

#include "jflow/metrics/metrics.h"

namespace jflow {
namespace stages {

class OutputWriter : public metrics::Metrics {
 public:
  /*** Write: Write data to path, or to `console` when path is empty or "-". */
  static bool Write(const std::string& path, const std::string& data, std::ostream& console,
                    std::string& err);
};

}  // namespace stages
}  // namespace jflow
