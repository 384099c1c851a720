/***
 * Name: jflow::support::WriteFile
 * Purpose: Write a rendered artifact to disk.
 * Inputs:
 *   - path: filesystem path to write (truncated if present)
 *   - data: content to write
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: The parent directory is never created here; a missing one
 *   is reported by name. Other open failures carry the errno text.
 */
#include "jflow/support/fs.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>

namespace jflow {
namespace support {

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  std::error_code ec;
  if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
    err = "failed to open file for write: " + path + " (no directory '" + parent.string() + "')";
    return false;
  }
  errno = 0;
  std::ofstream file_stream(path, std::ios::binary | std::ios::trunc);
  if (!file_stream.is_open()) {
    err = "failed to open file for write: " + path;
    if (errno != 0) {
      err += std::string(" (") + std::strerror(errno) + ")";
    }
    return false;
  }
  file_stream << data;
  file_stream.flush();
  if (!file_stream.good()) {
    err = "failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace jflow
