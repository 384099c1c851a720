/***
 * Name: jflow::stages::FileReader
 * Purpose: Stage class that loads the Java source to analyze.
 * Inputs: Filesystem path, or kStdinPath
 * Outputs: Source bytes, unmodified
 * Theory of Operation: Wraps support::ReadFile / support::ReadStream under the
 *   ReadFile phase timer.
 */
#pragma once

#include <string>

#include "jflow/metrics/metrics.h"

namespace jflow {
namespace stages {

class FileReader : public metrics::Metrics {
 public:
  /*** Path token that selects standard input. */
  static constexpr const char* kStdinPath = "-";

  static bool Read(const std::string& path, std::string& out_src, std::string& err);
};

}  // namespace stages
}  // namespace jflow
