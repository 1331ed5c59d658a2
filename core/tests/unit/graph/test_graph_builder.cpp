// tests/unit/graph/test_graph_builder.cpp - Graph construction, link pairing and entry nodes
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "flowplan/basic/errors.hpp"
#include "flowplan/graph/graph_builder.hpp"
#include "flowplan/test_support/workflow_builder.hpp"

using namespace flowplan;
using flowplan::test_support::WorkflowBuilder;

static size_t count_edges(const WorkflowGraph & graph, SemanticTag tag)
{
  return static_cast<size_t>(std::count_if(
    graph.edges().begin(), graph.edges().end(), [tag](const Edge & e) { return e.is(tag); }));
}

// ============================================================================
// Nodes and edges
// ============================================================================

TEST(GraphBuilderTest, ResolvesEdgeSemantics)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").prompt("p", "prompts/a.md").then("a", "b").feeds("p", "a");
  const WorkflowGraph graph = wb.graph();

  ASSERT_EQ(graph.size(), 3U);
  ASSERT_EQ(graph.edges().size(), 2U);
  EXPECT_TRUE(graph.edges()[0].is(SemanticTag::Sequential));
  EXPECT_EQ(graph.edges()[1].semantics, EdgeSemantics::input_data(InputKind::Instruction));
  EXPECT_FALSE(graph.edges()[0].is_virtual());

  const Node * a = graph.get_node("a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->kind, NodeKind::Task);
  EXPECT_EQ(a->region_id, "main");
  EXPECT_EQ(a->incoming.size(), 1U);
  EXPECT_EQ(a->outgoing.size(), 1U);
}

TEST(GraphBuilderTest, KeepsUnknownEdgesAsUnknown)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").edge("a", "b", "weird", "handles");
  const WorkflowGraph graph = wb.graph();

  ASSERT_EQ(graph.edges().size(), 1U);
  EXPECT_TRUE(graph.edges()[0].is(SemanticTag::Unknown));
}

TEST(GraphBuilderTest, DefaultsMissingNames)
{
  WorkflowInput input;
  Region region;
  region.id = "r";
  region.name = "R";
  RawNode node;
  node.id = "n1";
  node.type = "agent";
  region.nodes.push_back(node);
  input.regions.push_back(region);

  const WorkflowGraph graph = GraphBuilder().build(input);
  ASSERT_NE(graph.get_node("n1"), nullptr);
  EXPECT_EQ(graph.get_node("n1")->name, "agent_n1");
  EXPECT_EQ(graph.region_name("r"), "R");
}

TEST(GraphBuilderTest, EntryNodesAreTasksWithoutSequentialPredecessor)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").prompt("p", "p.md").then("a", "b").alongside("a", "c");
  const WorkflowGraph graph = wb.graph();

  EXPECT_EQ(graph.entry_nodes(), (std::vector<std::string>{"a", "c"}));
}

TEST(GraphBuilderTest, StartNodeDoesNotDisqualifyEntry)
{
  WorkflowBuilder wb;
  wb.node("s", "start").task("a").task("b").feeds("s", "a").then("a", "b");
  const WorkflowGraph graph = wb.graph();

  EXPECT_EQ(graph.entry_nodes(), (std::vector<std::string>{"a"}));
}

TEST(GraphBuilderTest, UserInputPauseIsBridged)
{
  WorkflowBuilder wb;
  wb.task("a").node("ui", "userInput").task("b").then("a", "ui").then("ui", "b");
  const WorkflowGraph graph = wb.graph();

  ASSERT_EQ(graph.edges().size(), 3U);
  const Edge & bridge = graph.edges()[2];
  EXPECT_TRUE(bridge.is_virtual());
  EXPECT_TRUE(bridge.is(SemanticTag::Sequential));
  EXPECT_EQ(bridge.id, "__input_ui_a_b__");
  EXPECT_EQ(bridge.source_id, "a");
  EXPECT_EQ(bridge.target_id, "b");

  EXPECT_EQ(graph.entry_nodes(), (std::vector<std::string>{"a"}));
}

TEST(GraphBuilderTest, TriggerUserInputStartsTheFlow)
{
  WorkflowBuilder wb;
  wb.node("ui", "userInput").task("a").task("b").then("ui", "a").then("a", "b");
  const WorkflowGraph graph = wb.graph();

  EXPECT_EQ(count_edges(graph, SemanticTag::Sequential), 2U);
  EXPECT_EQ(graph.entry_nodes(), (std::vector<std::string>{"a"}));
}

// ============================================================================
// Structural errors
// ============================================================================

TEST(GraphBuilderTest, RejectsDuplicateNodeId)
{
  WorkflowBuilder wb;
  wb.task("a").region("second").task("a");

  try {
    (void)wb.graph();
    FAIL() << "expected StructuralError";
  } catch (const StructuralError & e) {
    EXPECT_EQ(e.code(), "E0103");
    EXPECT_EQ(e.location().region_id, "second");
  }
}

TEST(GraphBuilderTest, RejectsUnknownEndpoint)
{
  WorkflowBuilder wb;
  wb.task("a").then("a", "ghost");

  try {
    (void)wb.graph();
    FAIL() << "expected StructuralError";
  } catch (const StructuralError & e) {
    EXPECT_EQ(e.code(), "E0101");
    EXPECT_NE(std::string(e.what()).find("unknown target node 'ghost'"), std::string::npos);
  }
}

TEST(GraphBuilderTest, RejectsDuplicateLinkNameInRegion)
{
  WorkflowBuilder wb;
  wb.link_out("o1", "x").link_out("o2", "x");
  EXPECT_THROW((void)wb.graph(), StructuralError);
}

TEST(GraphBuilderTest, SameLinkNameInDifferentRegionsIsAllowed)
{
  WorkflowBuilder wb;
  wb.link_out("o1", "x").region("other").link_out("o2", "x");
  EXPECT_NO_THROW((void)wb.graph());
}

// ============================================================================
// Cross-region links
// ============================================================================

TEST(GraphBuilderTest, LinkPairsAreBridgedWithVirtualSequentialEdges)
{
  WorkflowBuilder wb;
  wb.region("r1", "One").task("a").link_out("out", "handoff").feeds("a", "out");
  wb.region("r2", "Two").link_in("in", "handoff").task("b").feeds("in", "b");
  const WorkflowGraph graph = wb.graph();

  ASSERT_EQ(graph.link_pairs().size(), 1U);
  EXPECT_EQ(graph.link_pairs()[0].name, "handoff");
  EXPECT_EQ(graph.link_pairs()[0].out_node_id, "out");
  EXPECT_EQ(graph.link_pairs()[0].in_node_id, "in");

  EXPECT_EQ(count_edges(graph, SemanticTag::CrossRegionLink), 2U);

  const Node * a = graph.get_node("a");
  ASSERT_NE(a, nullptr);
  const auto succ = graph.sequential_successors(*a);
  ASSERT_EQ(succ.size(), 1U);
  EXPECT_EQ(succ[0]->id, "b");

  const auto bridges = graph.outgoing(*a, SemanticTag::Sequential);
  ASSERT_EQ(bridges.size(), 1U);
  EXPECT_TRUE(bridges[0]->is_virtual());
  EXPECT_EQ(bridges[0]->id, "__link_handoff_a_b__");

  EXPECT_EQ(graph.entry_nodes(), (std::vector<std::string>{"a"}));
}

TEST(GraphBuilderTest, OneOutboundLinkFeedsEveryInbound)
{
  WorkflowBuilder wb;
  wb.region("r1").task("a").link_out("out", "fan").feeds("a", "out");
  wb.region("r2").link_in("in1", "fan").task("b").feeds("in1", "b");
  wb.region("r3").link_in("in2", "fan").task("c").feeds("in2", "c");
  const WorkflowGraph graph = wb.graph();

  EXPECT_EQ(graph.link_pairs().size(), 2U);
  const auto succ = graph.sequential_successors(*graph.get_node("a"));
  ASSERT_EQ(succ.size(), 2U);
  EXPECT_EQ(succ[0]->id, "b");
  EXPECT_EQ(succ[1]->id, "c");
}

TEST(GraphBuilderTest, UnpairedLinksProduceNoBridge)
{
  WorkflowBuilder wb;
  wb.task("a").link_out("out", "nowhere").feeds("a", "out");
  const WorkflowGraph graph = wb.graph();

  EXPECT_TRUE(graph.link_pairs().empty());
  EXPECT_EQ(count_edges(graph, SemanticTag::Sequential), 0U);
}

TEST(GraphBuilderTest, CustomRulesChangeResolution)
{
  EdgeRuleTable rules = EdgeRuleTable::defaults();
  EdgeRule r;
  r.source_kind = NodeKind::Task;
  r.target_kind = NodeKind::Task;
  r.semantics = EdgeSemantics::of(SemanticTag::Sequential);
  r.priority = 1;
  rules.add_rule(r);

  WorkflowBuilder wb;
  wb.task("a").task("b").edge("a", "b");
  const WorkflowGraph graph = GraphBuilder(rules).build(wb.input());

  ASSERT_EQ(graph.edges().size(), 1U);
  EXPECT_TRUE(graph.edges()[0].is(SemanticTag::Sequential));
}
