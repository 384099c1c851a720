/***
 * Name: jflow::support::ReadFile
 * Purpose: Read the full contents of a Java source file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Binary mode so byte offsets reported by the parser match
 *   the file on disk. A directory opens fine on some platforms, so it is checked first.
 */
#include "jflow/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>

namespace jflow {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    err = "cannot read '" + path + "': is a directory";
    return false;
  }
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.is_open()) {
    err = "failed to open file: " + path;
    return false;
  }
  return ReadStream(file_stream, path, out, err);
}

}  // namespace support
}  // namespace jflow
