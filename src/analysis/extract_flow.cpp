/***
 * Name: jflow::analysis::ExtractFlow
 * Purpose: Flow model and internal callees of one method declaration.
 */
#include "jflow/analysis/flow_extractor.h"

#include "jflow/analysis/call_classifier.h"
#include "jflow/analysis/detail/flow_extractor.h"

namespace jflow::analysis {

ExtractedFlow ExtractFlow(const syntax::SyntaxNode& method_declaration,
                          std::string_view source,
                          const MethodRegistry& registry) {
  ExtractedFlow out;
  const auto body = method_declaration.ChildByFieldName("body");
  if (body.IsNull()) {
    return out;
  }
  const detail::FlowExtractor extractor(source, registry);
  out.steps = extractor.Extract(body);
  for (const auto& call : ClassifyCalls(body, source, registry)) {
    if (!call.is_external && registry.find(call.name) != registry.end()) {
      out.internal_calls.push_back(call.name);
    }
  }
  return out;
}

}  // namespace jflow::analysis
