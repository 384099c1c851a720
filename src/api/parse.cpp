/***
 * Name: jflow::Parse
 * Purpose: Source text to CallGraph.
 * Theory of Operation: In strict mode the first ERROR/MISSING node is reported as
 *   a SyntaxError with its 1-based position; otherwise broken regions are simply
 *   skipped by the analysis passes.
 */
#include <string>
#include <string_view>

#include "jflow/analysis/call_graph_builder.h"
#include "jflow/exceptions/syntax_error.h"
#include "jflow/jflow.h"
#include "jflow/syntax/syntax_tree.h"

namespace jflow {

static std::string DescribeError(const syntax::SyntaxNode& node, std::string_view source) {
  if (node.IsMissing()) {
    return "missing '" + std::string(node.Kind()) + "'";
  }
  const auto text = node.Text(source);
  const auto newline = text.find('\n');
  return "unexpected '" + std::string(text.substr(0, newline)) + "'";
}

model::CallGraph Parse(std::string_view source, const ParseOptions& options) {
  const auto tree = syntax::SyntaxTree::Parse(source);
  if (options.reject_syntax_errors) {
    if (const auto error = tree.FirstError()) {
      throw exceptions::SyntaxError(DescribeError(*error, source), error->StartLine(),
                                    error->StartColumn());
    }
  }
  return analysis::BuildCallGraph(tree.Root(), source);
}

}  // namespace jflow
