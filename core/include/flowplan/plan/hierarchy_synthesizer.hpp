// flowplan/plan/hierarchy_synthesizer.hpp - Fork/join reconstruction from the DAG
//
// Converts the SEQUENTIAL subgraph of a validated, acyclic WorkflowGraph into
// a tree of Sequence/Parallel/Leaf nodes. Each task-like node reachable from
// the roots is placed exactly once.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "flowplan/graph/workflow_graph.hpp"
#include "flowplan/plan/hierarchy.hpp"

namespace flowplan
{

/**
 * Mutable state of one synthesis run.
 */
struct SynthesisState
{
  std::unordered_set<std::string> visited;
  uint32_t next_wrapper_id = 0;
  bool used = false;
};

class HierarchySynthesizer
{
public:
  explicit HierarchySynthesizer(const WorkflowGraph & graph) : graph_(graph) {}

  HierarchySynthesizer(const HierarchySynthesizer &) = delete;
  HierarchySynthesizer & operator=(const HierarchySynthesizer &) = delete;

  /**
   * Synthesize the execution tree rooted at `roots` (normally the graph's
   * entry nodes).
   *
   * The graph must be free of SEQUENTIAL cycles. Unknown or non task-like
   * root ids are ignored.
   *
   * @return The tree, or std::nullopt when no task is reachable
   * @throws std::logic_error if called more than once on the same instance
   */
  [[nodiscard]] std::optional<HierarchyNode> synthesize(const std::vector<std::string> & roots);

  /// Ids of every task placed in the tree so far.
  [[nodiscard]] const std::unordered_set<std::string> & placed() const noexcept
  {
    return state_.visited;
  }

private:
  using NodeSet = std::unordered_set<std::string>;

  /**
   * Limit of a fork's branches: the merge point and every task after it.
   * Those tasks belong to the continuation, never to a branch.
   */
  struct Boundary
  {
    NodeSet closed;
  };

  std::optional<HierarchyNode> build(
    const std::vector<std::string> & roots, const Boundary * bound);
  std::optional<HierarchyNode> build_chain(const std::string & start, const Boundary * bound);
  std::optional<HierarchyNode> build_fork_join(
    const std::vector<std::string> & roots, const std::string & merge, const Boundary * bound);
  std::optional<HierarchyNode> build_fan_out(
    const std::vector<std::string> & roots, const Boundary * bound);

  [[nodiscard]] std::optional<std::string> find_merge_point(
    const std::vector<std::string> & roots, const Boundary * bound) const;
  [[nodiscard]] NodeSet reachable_from(const std::string & root, const Boundary * bound) const;

  /// `merge` and every task-like node after it, nested inside `outer`.
  [[nodiscard]] Boundary boundary_at(const std::string & merge, const Boundary * outer) const;

  /// Unvisited task-like SEQUENTIAL successors of `id` inside `bound`.
  [[nodiscard]] std::vector<std::string> open_successors(
    const std::string & id, const Boundary * bound) const;

  HierarchyNode make_sequence(std::vector<HierarchyNode> children);
  HierarchyNode make_parallel(std::vector<HierarchyNode> children);
  std::string next_id(const char * prefix);

  const WorkflowGraph & graph_;
  SynthesisState state_;
};

}  // namespace flowplan
