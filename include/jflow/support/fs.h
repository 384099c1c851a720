/***
 * Name: jflow::support (fs)
 * Purpose: File and stream IO helpers for source input and rendered output.
 * Inputs: Paths, streams and string buffers
 * Outputs: Contents to/from disk; `bool` plus an error string on failure
 * Theory of Operation: Error strings name the path and, where the OS reports one,
 *   the reason, so callers can print them unchanged after a "jflow: " prefix.
 */
#pragma once

#include <istream>
#include <string>

namespace jflow {
namespace support {

/*** ReadFile: Read entire file into out. Directories are rejected. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** ReadStream: Drain `in` into out; `name` labels the error (e.g. "<stdin>"). */
bool ReadStream(std::istream& in, const std::string& name, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path; the parent directory must exist. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace jflow
