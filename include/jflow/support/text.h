/***
 * Name: jflow::support (text)
 * Purpose: Small string helpers shared by the analysis and rendering stages.
 * Inputs: Source slices and labels
 * Outputs: Trimmed, flattened, quote-safe and truncated text
 * Theory of Operation: Rendered labels are embedded in double-quoted, line-oriented
 *   flowchart statements, so labels must be single-line and free of '"'.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace jflow {
namespace support {

/*** Trim: Remove leading and trailing ASCII whitespace. */
std::string_view Trim(std::string_view text);

/*** NormalizeQuotes: Replace every '"' with '\''. */
std::string NormalizeQuotes(std::string_view text);

/*** FlattenLines: Replace '\n' with ' ' and drop '\r'. */
std::string FlattenLines(std::string_view text);

/*** SanitizeLabel: FlattenLines then NormalizeQuotes. Idempotent. */
std::string SanitizeLabel(std::string_view text);

/*** TruncateLabel: Keep at most `keep` bytes plus "..." when text exceeds `limit` bytes. */
std::string TruncateLabel(std::string_view text, std::size_t limit, std::size_t keep);

/*** ReceiverPrefix: Substring before the first top-level '.', or the whole receiver. */
std::string_view ReceiverPrefix(std::string_view receiver);

/*** JsonEscape: Escape a string for inclusion in a JSON string literal. */
std::string JsonEscape(std::string_view text);

}  // namespace support
}  // namespace jflow
