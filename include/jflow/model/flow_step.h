/***
 * Name: jflow::model (flow model)
 * Purpose: Structured control-flow representation of one method body.
 * Inputs: Built by the flow extractor
 * Outputs: Nested step sequences consumed by the renderer, printer and serializer
 * Theory of Operation: FlowStep is a closed sum over five step kinds held in a
 *   std::variant. Branch, body and case payloads are nested FlowSequences, so
 *   the model is a tree mirroring source nesting.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jflow {
namespace model {

struct FlowStep;
using FlowSequence = std::vector<FlowStep>;

enum class FlowKind { Call, Decision, Loop, Switch, Return };

inline const char* to_string(const FlowKind kind) {
  switch (kind) {
    case FlowKind::Call: return "Call";
    case FlowKind::Decision: return "Decision";
    case FlowKind::Loop: return "Loop";
    case FlowKind::Switch: return "Switch";
    case FlowKind::Return: return "Return";
  }
  return "Unknown";
}

struct CallStep {
  std::string name;
  bool is_external{false};
  std::string raw_text;   // receiver + call, exactly as written
  std::string receiver;   // empty when the call has no receiver
  std::size_t offset{0};
  std::uint32_t line{0};
};

struct DecisionStep {
  std::string label;
  std::size_t offset{0};
  std::uint32_t line{0};
  FlowSequence yes_branch;
  FlowSequence no_branch;
};

struct LoopStep {
  std::string label;
  std::size_t offset{0};
  std::uint32_t line{0};
  FlowSequence body;
};

struct SwitchCase {
  std::string label;
  FlowSequence steps;
};

struct SwitchStep {
  std::string label;
  std::size_t offset{0};
  std::uint32_t line{0};
  std::vector<SwitchCase> cases;
};

struct ReturnStep {
  std::string label;
  std::size_t offset{0};
  std::uint32_t line{0};
};

struct FlowStep {
  using Variant = std::variant<CallStep, DecisionStep, LoopStep, SwitchStep, ReturnStep>;

  // NOLINTBEGIN(google-explicit-constructor)
  FlowStep(CallStep step) : value(std::move(step)) {}
  FlowStep(DecisionStep step) : value(std::move(step)) {}
  FlowStep(LoopStep step) : value(std::move(step)) {}
  FlowStep(SwitchStep step) : value(std::move(step)) {}
  FlowStep(ReturnStep step) : value(std::move(step)) {}
  // NOLINTEND(google-explicit-constructor)

  FlowKind kind() const { return static_cast<FlowKind>(value.index()); }

  template <typename Step>
  const Step* as() const { return std::get_if<Step>(&value); }

  Variant value;
};

}  // namespace model
}  // namespace jflow
