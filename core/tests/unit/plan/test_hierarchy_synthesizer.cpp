// tests/unit/plan/test_hierarchy_synthesizer.cpp - Fork/join reconstruction
#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "flowplan/plan/hierarchy_synthesizer.hpp"
#include "flowplan/test_support/workflow_builder.hpp"

using namespace flowplan;
using flowplan::test_support::WorkflowBuilder;

namespace
{

std::optional<HierarchyNode> synthesize(const WorkflowGraph & graph)
{
  HierarchySynthesizer synthesizer(graph);
  return synthesizer.synthesize(graph.entry_nodes());
}

void expect_each_task_once(const WorkflowGraph & graph, const HierarchyNode & plan)
{
  const std::vector<std::string> leaves = plan.leaf_ids();
  const std::unordered_set<std::string> unique(leaves.begin(), leaves.end());
  EXPECT_EQ(unique.size(), leaves.size()) << plan.to_string();

  for (const Node * task : graph.task_nodes()) {
    EXPECT_EQ(std::count(leaves.begin(), leaves.end(), task->id), 1)
      << task->id << " in " << plan.to_string();
  }
}

}  // namespace

// ============================================================================
// Shapes
// ============================================================================

TEST(HierarchySynthesizerTest, SingleTaskIsALeaf)
{
  WorkflowBuilder wb;
  wb.task("a", "Alpha");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_TRUE(plan->is_leaf());
  EXPECT_EQ(plan->id, "a");
  EXPECT_EQ(plan->name, "Alpha");
}

TEST(HierarchySynthesizerTest, LinearChainIsOneSequence)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").then("a", "b").then("b", "c");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[a, b, c]");
  EXPECT_EQ(plan->id, "__seq_0__");
}

TEST(HierarchySynthesizerTest, ForkWithoutJoin)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").then("a", "b").then("a", "c");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[a, Parallel[b, c]]");
}

TEST(HierarchySynthesizerTest, ForkWithBranchChains)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").task("d").task("e");
  wb.then("a", "b").then("a", "c").then("b", "d").then("c", "e");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[a, Parallel[Sequence[b, d], Sequence[c, e]]]");
}

TEST(HierarchySynthesizerTest, DiamondJoinsAtMergePoint)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").task("d");
  wb.then("a", "b").then("a", "c").then("b", "d").then("c", "d");
  const WorkflowGraph graph = wb.graph();
  const auto plan = synthesize(graph);

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[a, Sequence[Parallel[b, c], d]]");
  expect_each_task_once(graph, *plan);
}

TEST(HierarchySynthesizerTest, DiamondWithLongerBranches)
{
  WorkflowBuilder wb;
  wb.task("a").task("b1").task("b2").task("c").task("d").task("e");
  wb.then("a", "b1").then("b1", "b2").then("a", "c").then("b2", "d").then("c", "d");
  wb.then("d", "e");
  const WorkflowGraph graph = wb.graph();
  const auto plan = synthesize(graph);

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[a, Sequence[Parallel[Sequence[b1, b2], c], Sequence[d, e]]]");
  expect_each_task_once(graph, *plan);
}

TEST(HierarchySynthesizerTest, IndependentEntriesRunInParallel)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").then("b", "c");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Parallel[a, Sequence[b, c]]");
}

TEST(HierarchySynthesizerTest, EntriesJoiningLaterShareTheMerge)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").then("a", "c").then("b", "c");
  const WorkflowGraph graph = wb.graph();
  const auto plan = synthesize(graph);

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[Parallel[a, b], c]");
  expect_each_task_once(graph, *plan);
}

TEST(HierarchySynthesizerTest, MergePointComesFromFirstRootsSearch)
{
  // m1 and m2 are both common to b and c; searching from b finds m1 first.
  // m2 follows m1, so c's branch must not take it.
  WorkflowBuilder wb;
  wb.task("b").task("p").task("q").task("m1").task("m2").task("c").task("f").task("g");
  wb.then("b", "p").then("p", "q").then("q", "m1").then("m1", "m2");
  wb.then("c", "f").then("f", "m2").then("f", "g").then("g", "m1");
  const WorkflowGraph graph = wb.graph();
  ASSERT_EQ(graph.entry_nodes(), (std::vector<std::string>{"b", "c"}));

  const auto plan = synthesize(graph);
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(
    plan->to_string(),
    "Sequence[Parallel[Sequence[b, p, q], Sequence[c, f, g]], Sequence[m1, m2]]");
  expect_each_task_once(graph, *plan);
}

TEST(HierarchySynthesizerTest, BranchReachingAnotherBranchIsPlacedOnce)
{
  // b also feeds c directly, so c is reachable on two paths.
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").task("d");
  wb.then("a", "b").then("a", "c").then("b", "c").then("c", "d").then("b", "d");
  const WorkflowGraph graph = wb.graph();
  const auto plan = synthesize(graph);

  ASSERT_TRUE(plan.has_value());
  expect_each_task_once(graph, *plan);
}

TEST(HierarchySynthesizerTest, CrossRegionLinkBecomesSequence)
{
  WorkflowBuilder wb;
  wb.region("r1").task("a").link_out("out", "next").feeds("a", "out");
  wb.region("r2").link_in("in", "next").task("b").feeds("in", "b");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[a, b]");
}

TEST(HierarchySynthesizerTest, StartNodeDoesNotHideItsTask)
{
  WorkflowBuilder wb;
  wb.node("s", "start").task("a").task("b").feeds("s", "a").then("a", "b");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[a, b]");
}

TEST(HierarchySynthesizerTest, UserInputPauseKeepsOrder)
{
  WorkflowBuilder wb;
  wb.task("a").node("ui", "userInput").task("b").then("a", "ui").then("ui", "b");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "Sequence[a, b]");
}

TEST(HierarchySynthesizerTest, ProvidersAreNotPlaced)
{
  WorkflowBuilder wb;
  wb.task("a").prompt("p", "p.md").feeds("p", "a");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->leaf_ids(), (std::vector<std::string>{"a"}));
}

// ============================================================================
// Contract
// ============================================================================

TEST(HierarchySynthesizerTest, NoTasksYieldsNothing)
{
  WorkflowBuilder wb;
  wb.prompt("p", "p.md");
  const WorkflowGraph graph = wb.graph();
  HierarchySynthesizer synthesizer(graph);
  EXPECT_FALSE(synthesizer.synthesize(graph.entry_nodes()).has_value());
}

TEST(HierarchySynthesizerTest, UnknownRootsAreIgnored)
{
  WorkflowBuilder wb;
  wb.task("a").prompt("p", "p.md");
  const WorkflowGraph graph = wb.graph();
  HierarchySynthesizer synthesizer(graph);

  const auto plan = synthesizer.synthesize({"ghost", "p", "a", "a"});
  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->to_string(), "a");
}

TEST(HierarchySynthesizerTest, SecondCallThrows)
{
  WorkflowBuilder wb;
  wb.task("a");
  const WorkflowGraph graph = wb.graph();
  HierarchySynthesizer synthesizer(graph);

  (void)synthesizer.synthesize(graph.entry_nodes());
  EXPECT_THROW((void)synthesizer.synthesize(graph.entry_nodes()), std::logic_error);
}

TEST(HierarchySynthesizerTest, PlacedTracksEveryLeaf)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").then("a", "b");
  const WorkflowGraph graph = wb.graph();
  HierarchySynthesizer synthesizer(graph);
  (void)synthesizer.synthesize(graph.entry_nodes());

  EXPECT_EQ(synthesizer.placed().size(), 2U);
  EXPECT_EQ(synthesizer.placed().count("a"), 1U);
  EXPECT_EQ(synthesizer.placed().count("b"), 1U);
}

TEST(HierarchySynthesizerTest, IsDeterministic)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").task("c").task("d").task("e");
  wb.then("a", "b").then("a", "c").then("b", "d").then("c", "d").then("a", "e");
  const WorkflowGraph graph = wb.graph();

  const auto first = synthesize(graph);
  const auto second = synthesize(graph);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, *second);
}

TEST(HierarchySynthesizerTest, WrapperIdsAvoidExistingNodeIds)
{
  WorkflowBuilder wb;
  wb.task("__seq_0__").task("b").then("__seq_0__", "b");
  const auto plan = synthesize(wb.graph());

  ASSERT_TRUE(plan.has_value());
  EXPECT_EQ(plan->kind, HierarchyKind::Sequence);
  EXPECT_EQ(plan->id, "__seq_1__");
}
