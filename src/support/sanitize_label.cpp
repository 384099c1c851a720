/***
 * Name: jflow::support::SanitizeLabel
 * Purpose: Make arbitrary source text safe for a quoted, single-line flowchart label.
 * Inputs: text
 * Outputs: text without newlines or double quotes
 * Theory of Operation: FlattenLines followed by NormalizeQuotes; applying it
 *   twice changes nothing.
 */
#include "jflow/support/text.h"

#include <string>
#include <string_view>

namespace jflow {
namespace support {

std::string SanitizeLabel(std::string_view text) { return NormalizeQuotes(FlattenLines(text)); }

}  // namespace support
}  // namespace jflow
