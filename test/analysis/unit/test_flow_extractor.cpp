/***
 * Name: test_flow_extractor
 * Purpose: Validate FlowStep construction for calls, returns, decisions, loops and
 *   switches, including labels, nesting and fallbacks.
 */
#include <gtest/gtest.h>

#include <string>

#include "jflow/analysis/declaration_collector.h"
#include "jflow/analysis/flow_extractor.h"
#include "jflow/syntax/syntax_tree.h"

using namespace jflow;
using namespace jflow::analysis;

namespace {

// Wraps body statements in `class T { <helpers> void target() { <body> } }`.
ExtractedFlow ExtractTarget(const std::string& src) {
  const auto tree = syntax::SyntaxTree::Parse(src);
  const auto set = CollectDeclarations(tree.Root(), src);
  for (const auto& decl : set.declarations) {
    if (decl.name == "target") {
      return ExtractFlow(decl.node, src, set.registry);
    }
  }
  ADD_FAILURE() << "no method named target";
  return {};
}

std::string Wrap(const std::string& body) {
  return "class T {\n"
         "  void a() {}\n  void b() {}\n  void c() {}\n"
         "  void positive() {}\n  void negative() {}\n  void done() {}\n"
         "  void target() {\n" + body + "\n  }\n"
         "}\n";
}

}  // namespace

TEST(FlowExtractor, SequentialCallsKeepOrder) {
  const auto flow = ExtractTarget(Wrap("a(); b(); c();"));
  ASSERT_EQ(flow.steps.size(), 3u);
  EXPECT_EQ(flow.steps[0].as<model::CallStep>()->name, "a");
  EXPECT_EQ(flow.steps[1].as<model::CallStep>()->name, "b");
  EXPECT_EQ(flow.steps[2].as<model::CallStep>()->name, "c");
  EXPECT_EQ(flow.internal_calls, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(FlowExtractor, LocalDeclarationWithCall) {
  const auto flow = ExtractTarget(Wrap("int x = repo.count();"));
  ASSERT_EQ(flow.steps.size(), 1u);
  const auto* call = flow.steps[0].as<model::CallStep>();
  ASSERT_NE(call, nullptr);
  EXPECT_TRUE(call->is_external);
  EXPECT_EQ(call->raw_text, "repo.count()");
  EXPECT_TRUE(flow.internal_calls.empty());
}

TEST(FlowExtractor, IfElseBecomesDecision) {
  const auto flow = ExtractTarget(Wrap("if (x > 0) { positive(); } else { negative(); }\ndone();"));
  ASSERT_EQ(flow.steps.size(), 2u);
  const auto* decision = flow.steps[0].as<model::DecisionStep>();
  ASSERT_NE(decision, nullptr);
  EXPECT_EQ(decision->label, "(x > 0)");
  ASSERT_EQ(decision->yes_branch.size(), 1u);
  ASSERT_EQ(decision->no_branch.size(), 1u);
  EXPECT_EQ(decision->yes_branch[0].as<model::CallStep>()->name, "positive");
  EXPECT_EQ(decision->no_branch[0].as<model::CallStep>()->name, "negative");
  EXPECT_EQ(flow.steps[1].kind(), model::FlowKind::Call);
}

TEST(FlowExtractor, ConditionCallsPrecedeDecision) {
  const std::string src = Wrap("if (check(a())) { b(); }");
  const auto flow = ExtractTarget(src);
  ASSERT_EQ(flow.steps.size(), 3u);
  EXPECT_EQ(flow.steps[0].as<model::CallStep>()->name, "check");
  EXPECT_EQ(flow.steps[1].as<model::CallStep>()->name, "a");
  const auto* decision = flow.steps[2].as<model::DecisionStep>();
  ASSERT_NE(decision, nullptr);
  EXPECT_EQ(decision->offset, src.find("(check(a()))"));
  EXPECT_TRUE(decision->no_branch.empty());
  EXPECT_EQ(flow.internal_calls, (std::vector<std::string>{"a", "b"}));
}

TEST(FlowExtractor, ElseIfNestsInNoBranch) {
  const auto flow = ExtractTarget(Wrap("if (x) { a(); } else if (y) { b(); } else { c(); }"));
  ASSERT_EQ(flow.steps.size(), 1u);
  const auto* outer = flow.steps[0].as<model::DecisionStep>();
  ASSERT_NE(outer, nullptr);
  ASSERT_EQ(outer->no_branch.size(), 1u);
  const auto* inner = outer->no_branch[0].as<model::DecisionStep>();
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->label, "(y)");
  EXPECT_EQ(inner->no_branch[0].as<model::CallStep>()->name, "c");
}

TEST(FlowExtractor, LoopLabelsPerKind) {
  const auto flow = ExtractTarget(Wrap(
      "while (i < 10) { a(); }\n"
      "for (int i = 0; i < n; i++) { b(); }\n"
      "for (String item : items) { c(); }\n"
      "do { a(); } while (running);"));
  ASSERT_EQ(flow.steps.size(), 4u);
  EXPECT_EQ(flow.steps[0].as<model::LoopStep>()->label, "while (i < 10)");
  EXPECT_EQ(flow.steps[1].as<model::LoopStep>()->label, "for (...)");
  EXPECT_EQ(flow.steps[2].as<model::LoopStep>()->label, "for (item : items)");
  EXPECT_EQ(flow.steps[3].as<model::LoopStep>()->label, "do...while (running)");
  for (const auto& step : flow.steps) {
    ASSERT_EQ(step.kind(), model::FlowKind::Loop);
    EXPECT_EQ(step.as<model::LoopStep>()->body.size(), 1u);
  }
}

TEST(FlowExtractor, LongLoopLabelIsTruncated) {
  const auto flow = ExtractTarget(
      Wrap("while (firstCondition && secondCondition && thirdCondition && fourthCondition) { a(); }"));
  const auto* loop = flow.steps.at(0).as<model::LoopStep>();
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(loop->label.size(), 60u);
  EXPECT_EQ(loop->label.substr(57), "...");
  EXPECT_EQ(loop->label.rfind("while (firstCondition", 0), 0u);
}

TEST(FlowExtractor, LoopBodyWithoutBlock) {
  const auto flow = ExtractTarget(Wrap("while (more()) a();"));
  const auto* loop = flow.steps.at(0).as<model::LoopStep>();
  ASSERT_NE(loop, nullptr);
  ASSERT_EQ(loop->body.size(), 1u);
  EXPECT_EQ(loop->body[0].as<model::CallStep>()->name, "a");
}

TEST(FlowExtractor, ClassicSwitchCasesInOrder) {
  const auto flow = ExtractTarget(Wrap(
      "switch (code) {\n"
      "  case 1: a(); break;\n"
      "  case 2: b(); break;\n"
      "  default: c();\n"
      "}"));
  ASSERT_EQ(flow.steps.size(), 1u);
  const auto* sw = flow.steps[0].as<model::SwitchStep>();
  ASSERT_NE(sw, nullptr);
  EXPECT_EQ(sw->label, "switch (code)");
  ASSERT_EQ(sw->cases.size(), 3u);
  EXPECT_EQ(sw->cases[0].label, "case 1");
  EXPECT_EQ(sw->cases[1].label, "case 2");
  EXPECT_EQ(sw->cases[2].label, "default");
  ASSERT_EQ(sw->cases[0].steps.size(), 1u);
  EXPECT_EQ(sw->cases[0].steps[0].as<model::CallStep>()->name, "a");
  EXPECT_EQ(sw->cases[2].steps[0].as<model::CallStep>()->name, "c");
}

TEST(FlowExtractor, ArrowSwitchRules) {
  const auto flow = ExtractTarget(Wrap(
      "switch (day) {\n"
      "  case MONDAY, TUESDAY -> a();\n"
      "  default -> b();\n"
      "}"));
  const auto* sw = flow.steps.at(0).as<model::SwitchStep>();
  ASSERT_NE(sw, nullptr);
  ASSERT_EQ(sw->cases.size(), 2u);
  EXPECT_EQ(sw->cases[0].label, "case MONDAY, TUESDAY");
  EXPECT_EQ(sw->cases[1].label, "default");
  EXPECT_EQ(sw->cases[1].steps.at(0).as<model::CallStep>()->name, "b");
}

TEST(FlowExtractor, ReturnKeepsTextAndFeedsAdjacency) {
  const auto flow = ExtractTarget(Wrap("return format(\"v\", a());"));
  ASSERT_EQ(flow.steps.size(), 1u);
  const auto* ret = flow.steps[0].as<model::ReturnStep>();
  ASSERT_NE(ret, nullptr);
  EXPECT_EQ(ret->label, "return format('v', a());");
  EXPECT_EQ(flow.internal_calls, (std::vector<std::string>{"a"}));
}

TEST(FlowExtractor, GenericFallbackRecursesIntoUnknownStatements) {
  const auto flow = ExtractTarget(Wrap("try { a(); } catch (Exception e) { b(); } finally { c(); }"));
  ASSERT_EQ(flow.steps.size(), 3u);
  EXPECT_EQ(flow.steps[0].as<model::CallStep>()->name, "a");
  EXPECT_EQ(flow.steps[1].as<model::CallStep>()->name, "b");
  EXPECT_EQ(flow.steps[2].as<model::CallStep>()->name, "c");
}

TEST(FlowExtractor, AbstractMethodHasNoFlow) {
  const std::string src = "interface S { void target(); }";
  const auto flow = ExtractTarget(src);
  EXPECT_TRUE(flow.steps.empty());
  EXPECT_TRUE(flow.internal_calls.empty());
}
