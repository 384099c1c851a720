/***
 * Name: jflow::support::ReadStream
 * Purpose: Drain an input stream (file or stdin) into a string.
 * Inputs: in, name (used in the error text)
 * Outputs: out on success; err on a stream failure
 * Theory of Operation: Copies via rdbuf; an empty stream yields an empty string.
 */
#include "jflow/support/fs.h"

#include <istream>
#include <iterator>
#include <string>
#include <utility>

namespace jflow {
namespace support {

bool ReadStream(std::istream& in, const std::string& name, std::string& out, std::string& err) {
  std::string data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    err = "failed to read " + name;
    return false;
  }
  out = std::move(data);
  return true;
}

}  // namespace support
}  // namespace jflow
