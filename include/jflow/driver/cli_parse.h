/***
 * Name: jflow::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose CLI option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple and low complexity.
 */
#pragma once

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jflow/driver/cli.h"

namespace jflow {
namespace driver {
namespace detail {

/***
 * Name: jflow::driver::detail::ParseChoice
 * Purpose: Match `<prefix><value>` against a fixed table of named choices.
 * Inputs: arg, prefix (e.g. "--emit="), choices, what (noun for the error text), out, err
 * Outputs: NotMatched when the prefix differs; Error for an unlisted value
 * Theory of Operation: Linear scan; the error lists every accepted name in table order.
 */
template <typename T, std::size_t N>
OptResult ParseChoice(const std::string& arg,
                      std::string_view prefix,
                      const std::array<std::pair<std::string_view, T>, N>& choices,
                      std::string_view what,
                      T& out,
                      std::ostream& err) {
  if (arg.rfind(prefix, 0) != 0U) {
    return OptResult::NotMatched;
  }
  const std::string_view value = std::string_view{arg}.substr(prefix.size());
  for (const auto& [name, choice] : choices) {
    if (name == value) {
      out = choice;
      return OptResult::Handled;
    }
  }
  err << "jflow: error: unknown " << what << " '" << value << "' (expected";
  for (std::size_t i = 0; i < N; ++i) {
    err << (i == 0 ? " " : (i + 1 == N ? " or " : ", ")) << choices[i].first;
  }
  err << ")" << '\n';
  return OptResult::Error;
}

/*** HandleMetricsArg: Parse --metrics and --metrics=.. variants. */
OptResult HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleNameListArg: Handle --opt <val> or --opt=<val> and append to a string list. */
struct NameListParams {
  const std::string& long_opt;
  const std::vector<std::string>& args;
  int& index;
  int argc;
  std::vector<std::string>& out;
  std::ostream& err;
};
OptResult HandleNameListArg(const std::string& arg, const NameListParams& p);

/*** HandleOutputArg: Handle -o <file> and --output=<file>. */
OptResult HandleOutputArg(const std::vector<std::string>& args,
                          int& index,
                          int argc,
                          CliOptions& dst,
                          std::ostream& err);

/*** HandleMethodArg: Handle -m <name> and --method=<name>. */
OptResult HandleMethodArg(const std::vector<std::string>& args,
                          int& index,
                          int argc,
                          CliOptions& dst,
                          std::ostream& err);

/*** HandleEmitArg: Handle --emit=mermaid|graph|services. */
OptResult HandleEmitArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleColorArg: Handle --color=auto|always|never. */
OptResult HandleColorArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleLogPathArg: Handle --log-path=<dir>. */
OptResult HandleLogPathArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleSwitch: Handle boolean switches, including -h/--help. */
OptResult HandleSwitch(const std::string& arg, CliOptions& dst);

/*** HandleUnknownOrPositional: Error on unknown '-' options; otherwise record input ("-" is stdin). */
OptResult HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace jflow
