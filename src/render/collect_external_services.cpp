/***
 * Name: jflow::render::CollectExternalServices
 * Purpose: Candidate filter names for a UI: every external receiver prefix used by
 *   the selected methods, including calls nested in branches, loops and cases.
 */
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "jflow/render/diagram_renderer.h"
#include "jflow/support/text.h"

namespace jflow::render {

namespace {

class ServiceCollector {
 public:
  void Walk(const model::FlowSequence& steps) {
    for (const auto& step : steps) {
      if (const auto* call = step.as<model::CallStep>()) {
        Add(*call);
      } else if (const auto* decision = step.as<model::DecisionStep>()) {
        Walk(decision->yes_branch);
        Walk(decision->no_branch);
      } else if (const auto* loop = step.as<model::LoopStep>()) {
        Walk(loop->body);
      } else if (const auto* sw = step.as<model::SwitchStep>()) {
        for (const auto& entry : sw->cases) {
          Walk(entry.steps);
        }
      }
    }
  }

  std::vector<std::string> Take() { return std::move(services_); }

 private:
  void Add(const model::CallStep& call) {
    if (!call.is_external || call.receiver.empty()) {
      return;
    }
    std::string prefix(support::ReceiverPrefix(call.receiver));
    if (seen_.insert(prefix).second) {
      services_.push_back(std::move(prefix));
    }
  }

  std::set<std::string> seen_;
  std::vector<std::string> services_;
};

}  // namespace

std::vector<std::string> CollectExternalServices(const model::CallGraph& graph,
                                                 const std::vector<std::string>& methods) {
  ServiceCollector collector;
  for (const auto& name : methods) {
    const auto it = graph.flows.find(name);
    if (it != graph.flows.end()) {
      collector.Walk(it->second);
    }
  }
  return collector.Take();
}

}  // namespace jflow::render
