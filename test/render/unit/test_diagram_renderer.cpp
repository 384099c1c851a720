/***
 * Name: test_diagram_renderer
 * Purpose: Unit coverage for target selection, suppression, service collection
 *   and frontier merging on hand-built models.
 */
#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "jflow/model/call_graph.h"
#include "jflow/render/detail/flow_renderer.h"
#include "jflow/render/diagram_renderer.h"
#include "jflow/render/render_config.h"

using namespace jflow;

namespace {

model::MethodNode Method(const std::string& name, std::vector<std::string> modifiers) {
  model::MethodNode node;
  node.name = name;
  node.modifiers = std::move(modifiers);
  node.return_type = "void";
  return node;
}

model::CallStep External(const std::string& receiver, const std::string& name) {
  model::CallStep call;
  call.name = name;
  call.receiver = receiver;
  call.raw_text = receiver + "." + name + "()";
  call.is_external = true;
  return call;
}

model::CallGraph SampleGraph() {
  model::CallGraph graph;
  graph.nodes["b"] = Method("b", {"public"});
  graph.nodes["a"] = Method("a", {"protected", "static"});
  graph.nodes["c"] = Method("c", {"private"});
  graph.nodes["d"] = Method("d", {"@Override"});
  return graph;
}

}  // namespace

TEST(SelectTargets, PublicSurfaceInNameOrder) {
  const auto selection = render::SelectTargets(SampleGraph(), std::nullopt);
  EXPECT_FALSE(selection.resolved);
  EXPECT_EQ(selection.methods, (std::vector<std::string>{"a", "b"}));
}

TEST(SelectTargets, NamedMethodIgnoresVisibility) {
  const auto selection = render::SelectTargets(SampleGraph(), std::string("c"));
  EXPECT_TRUE(selection.resolved);
  EXPECT_EQ(selection.methods, (std::vector<std::string>{"c"}));
}

TEST(SelectTargets, UnknownNameFallsBack) {
  const auto selection = render::SelectTargets(SampleGraph(), std::string("zzz"));
  EXPECT_FALSE(selection.resolved);
  EXPECT_EQ(selection.methods, (std::vector<std::string>{"a", "b"}));
}

TEST(IsSuppressed, InternalAndBareCallsNeverHidden) {
  render::RenderConfig config;
  config.ignored_service_names = {"helper", "this"};
  model::CallStep bare;
  bare.name = "helper";
  bare.is_external = true;
  EXPECT_FALSE(render::IsSuppressed(bare, config));

  model::CallStep internal;
  internal.name = "helper";
  internal.receiver = "this";
  EXPECT_FALSE(render::IsSuppressed(internal, config));
}

TEST(IsSuppressed, MatchesExactPrefixAndDottedForms) {
  render::RenderConfig config;
  config.ignored_variable_names = {"repo", "System.out"};
  EXPECT_TRUE(render::IsSuppressed(External("repo", "save"), config));
  EXPECT_TRUE(render::IsSuppressed(External("repo.inner", "save"), config));
  EXPECT_TRUE(render::IsSuppressed(External("System.out", "println"), config));
  EXPECT_FALSE(render::IsSuppressed(External("System.err", "println"), config));
  EXPECT_FALSE(render::IsSuppressed(External("repository", "save"), config));
}

TEST(IsSuppressed, EitherSetSuffices) {
  render::RenderConfig by_service;
  by_service.ignored_service_names = {"logger"};
  render::RenderConfig by_variable;
  by_variable.ignored_variable_names = {"logger"};
  EXPECT_TRUE(render::IsSuppressed(External("logger", "info"), by_service));
  EXPECT_TRUE(render::IsSuppressed(External("logger", "info"), by_variable));
}

TEST(DefaultIgnoredServices, ConsoleStreams) {
  const auto names = render::DefaultIgnoredServices();
  EXPECT_EQ(names.size(), 2U);
  EXPECT_EQ(names.count("System.out"), 1U);
  EXPECT_EQ(names.count("System.err"), 1U);
}

TEST(CollectExternalServices, NestedStepsFirstSeenOrder) {
  auto graph = SampleGraph();
  model::DecisionStep decision;
  decision.label = "(x)";
  decision.yes_branch.emplace_back(External("cache", "get"));
  decision.no_branch.emplace_back(External("repo", "load"));
  model::LoopStep loop;
  loop.label = "while (true)";
  loop.body.emplace_back(External("cache.stats", "hit"));
  model::SwitchStep sw;
  sw.label = "switch (k)";
  model::SwitchCase entry;
  entry.label = "case 1";
  entry.steps.emplace_back(External("queue", "push"));
  sw.cases.push_back(std::move(entry));

  graph.flows["a"].emplace_back(External("repo", "save"));
  graph.flows["a"].emplace_back(std::move(decision));
  graph.flows["a"].emplace_back(std::move(loop));
  graph.flows["b"].emplace_back(std::move(sw));
  graph.flows["c"].emplace_back(External("hidden", "x"));

  const auto services = render::CollectExternalServices(graph, {"a", "b"});
  EXPECT_EQ(services, (std::vector<std::string>{"repo", "cache", "queue"}));
}

TEST(MergeFrontier, AppendsOnlyNewIds) {
  render::detail::Frontier into{"N1", "N2"};
  render::detail::MergeFrontier(into, {"N2", "N3", "N1", "N4"});
  EXPECT_EQ(into, (render::detail::Frontier{"N1", "N2", "N3", "N4"}));
}

TEST(FlowRenderer, CollapsedMethodIsSingleNode) {
  std::ostringstream out;
  render::RenderConfig config;
  render::detail::FlowRenderer renderer(config, out);
  auto node = Method("run", {"public"});
  node.range = {4, 20};
  renderer.RenderCollapsed(node);
  EXPECT_EQ(out.str(),
            "    N1([\"run\"]):::public\n"
            "    click N1 call onNodeClick(\"offset-4\") \"Scroll to source\"\n");
}

TEST(FlowRenderer, EmptyFlowLinksStartToEnd) {
  std::ostringstream out;
  render::RenderConfig config;
  render::detail::FlowRenderer renderer(config, out);
  auto node = Method("noop", {"public"});
  node.range = {0, 9};
  renderer.RenderMethod(node, {});
  const auto text = out.str();
  EXPECT_NE(text.find("    N1 --> N2\n"), std::string::npos);
  EXPECT_NE(text.find("    N2([\"End of noop\"]):::endNode\n"), std::string::npos);
  EXPECT_NE(text.find("onNodeClick(\"offset-9\")"), std::string::npos);
}

TEST(FlowRenderer, EmptySwitchContinuesFromHeader) {
  std::ostringstream out;
  render::RenderConfig config;
  render::detail::FlowRenderer renderer(config, out);
  model::SwitchStep sw;
  sw.label = "switch (x)";
  model::FlowSequence flow;
  flow.emplace_back(std::move(sw));
  renderer.RenderMethod(Method("m", {"public"}), flow);
  EXPECT_NE(out.str().find("    N2 --> N3\n"), std::string::npos);
}

TEST(FlowRenderer, MultiEdgeFrontierLabelsFirstEdgeOnly) {
  std::ostringstream out;
  render::RenderConfig config;
  render::detail::FlowRenderer renderer(config, out);
  model::DecisionStep inner;
  inner.label = "(b)";
  inner.yes_branch.emplace_back(External("x", "y"));
  model::DecisionStep outer;
  outer.label = "(a)";
  outer.yes_branch.emplace_back(std::move(inner));
  outer.yes_branch.emplace_back(External("z", "w"));
  model::FlowSequence flow;
  flow.emplace_back(std::move(outer));
  renderer.RenderMethod(Method("m", {"public"}), flow);
  const auto text = out.str();
  // N2 outer, N3 inner (Yes from N2), N4 x.y; z.w joins N4 and N3
  EXPECT_NE(text.find("    N2 -->|Yes| N3\n"), std::string::npos);
  EXPECT_NE(text.find("    N3 -->|Yes| N4\n"), std::string::npos);
  EXPECT_NE(text.find("    N4 --> N5\n"), std::string::npos);
  EXPECT_NE(text.find("    N3 --> N5\n"), std::string::npos);
}

TEST(EscapeEdgeLabel, PipeBecomesEntity) {
  EXPECT_EQ(render::detail::EscapeEdgeLabel("Yes"), "Yes");
  EXPECT_EQ(render::detail::EscapeEdgeLabel("case 'a|b'"), "case 'a#124;b'");
  EXPECT_EQ(render::detail::EscapeEdgeLabel("||"), "#124;#124;");
}

TEST(FlowRenderer, SubgraphIdsAreGeneratedPerMethod) {
  std::ostringstream out;
  render::RenderConfig config;
  render::detail::FlowRenderer renderer(config, out);
  renderer.RenderMethod(Method("end", {"public"}), {});
  renderer.RenderMethod(Method("N1", {"public"}), {});
  const auto text = out.str();
  EXPECT_EQ(text.rfind("  subgraph S1[\"end\"]\n", 0), 0U);
  EXPECT_NE(text.find("  subgraph S2[\"N1\"]\n"), std::string::npos);
  EXPECT_EQ(text.find("subgraph end"), std::string::npos);
  EXPECT_EQ(text.find("subgraph N1"), std::string::npos);
}

TEST(CollectExternalServices, DotsInsideArgumentsDoNotSplitReceiver) {
  auto graph = SampleGraph();
  graph.flows["a"].emplace_back(External("repoFor(cfg.name)", "save"));
  graph.flows["a"].emplace_back(External("shards[cfg.idx].client", "put"));
  const auto services = render::CollectExternalServices(graph, {"a"});
  EXPECT_EQ(services, (std::vector<std::string>{"repoFor(cfg.name)", "shards[cfg.idx]"}));
}
