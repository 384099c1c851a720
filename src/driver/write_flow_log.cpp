/***
 * Name: jflow::driver::WriteFlowLog
 * Purpose: Write the FlowPrinter dump of a graph to a timestamped log file.
 * Inputs:
 *   - opts: log_path
 *   - graph: analyzed call graph
 * Outputs: true on success; false after printing a 'jflow: ' message
 */
#include "jflow/driver/app.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

#include "jflow/observability/flow_printer.h"

namespace jflow::driver {

static std::string TimestampPrefix() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &now_time);
#else
  localtime_r(&now_time, &tm_buf);
#endif
  std::ostringstream stamp;
  stamp << std::put_time(&tm_buf, "%Y%m%d-%H%M%S");
  return stamp.str() + "-";
}

auto WriteFlowLog(const driver::CliOptions& opts, const model::CallGraph& graph) -> bool {
  namespace fs = std::filesystem;
  const std::string log_dir = opts.log_path.empty() ? std::string(".") : opts.log_path;
  std::error_code err_code;
  if (!fs::exists(log_dir, err_code)) {
    if (!fs::create_directories(log_dir, err_code) && !fs::exists(log_dir)) {
      std::cerr << "jflow: failed to create log directory '" << log_dir << "': " << err_code.message() << "\n";
      return false;
    }
  }
  const std::string path = log_dir + "/" + TimestampPrefix() + "flow.log";
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    std::cerr << "jflow: failed to open log file '" << path << "'\n";
    return false;
  }
  observability::FlowPrinter printer;
  file << printer.print(graph);
  if (!file) {
    std::cerr << "jflow: failed to write log file '" << path << "'\n";
    return false;
  }
  return true;
}

}  // namespace jflow::driver
