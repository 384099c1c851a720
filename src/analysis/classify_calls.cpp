/***
 * Name: jflow::analysis::ClassifyCalls
 * Purpose: Collect and classify method invocations of a subtree.
 * Inputs: subtree, source text, method registry
 * Outputs: call steps in pre-order
 * Theory of Operation: The invocation itself is recorded before its children, so
 *   `a(b())` yields a then b. The receiver is the trimmed `object` field text.
 */
#include "jflow/analysis/call_classifier.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jflow/support/text.h"

namespace jflow::analysis {

static void Visit(const syntax::SyntaxNode& node, std::string_view source,
                  const MethodRegistry& registry, std::vector<model::CallStep>& out) {
  if (node.Kind() == "method_invocation") {
    const auto name_node = node.ChildByFieldName("name");
    if (!name_node.IsNull()) {
      model::CallStep call;
      call.name = std::string(support::Trim(name_node.Text(source)));
      call.raw_text = std::string(node.Text(source));
      const auto object = node.ChildByFieldName("object");
      bool internal = false;
      if (object.IsNull()) {
        internal = registry.find(call.name) != registry.end();
      } else {
        call.receiver = std::string(support::Trim(object.Text(source)));
        internal = call.receiver == "this";
      }
      call.is_external = !internal;
      call.offset = node.StartByte();
      call.line = node.StartLine();
      out.push_back(std::move(call));
    }
  }
  for (const auto& child : node.Children()) {
    Visit(child, source, registry, out);
  }
}

std::vector<model::CallStep> ClassifyCalls(const syntax::SyntaxNode& node,
                                           std::string_view source,
                                           const MethodRegistry& registry) {
  std::vector<model::CallStep> out;
  if (!node.IsNull()) {
    Visit(node, source, registry, out);
  }
  return out;
}

}  // namespace jflow::analysis
