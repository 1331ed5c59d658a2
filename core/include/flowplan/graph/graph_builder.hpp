// flowplan/graph/graph_builder.hpp - Build a WorkflowGraph from region records
//
// Fail-fast: any structural problem raises StructuralError and no partial
// graph is returned.
//
#pragma once

#include <set>
#include <string>
#include <utility>

#include "flowplan/graph/edge_semantics.hpp"
#include "flowplan/graph/workflow_graph.hpp"
#include "flowplan/graph/workflow_input.hpp"

namespace flowplan
{

/**
 * Builds the typed node/edge graph.
 *
 * The pipeline consists of:
 * 1. Node creation (kind mapping, region tagging)
 * 2. Edge creation with semantics resolved through the rule table
 * 3. Link pairing by name
 * 4. Virtual SEQUENTIAL edges bridging every link pair and every user-input
 *    pause (task -> userInput -> task)
 * 5. Entry node computation
 */
class GraphBuilder
{
public:
  GraphBuilder() : rules_(EdgeRuleTable::defaults()) {}
  explicit GraphBuilder(EdgeRuleTable rules) : rules_(std::move(rules)) {}

  /**
   * Build a graph.
   *
   * @throws StructuralError on unknown edge endpoints, duplicate node ids or
   *         duplicate link names within a region
   */
  [[nodiscard]] WorkflowGraph build(const WorkflowInput & input) const;

  [[nodiscard]] const EdgeRuleTable & rules() const noexcept { return rules_; }

private:
  void create_nodes(const WorkflowInput & input, WorkflowGraph & graph) const;
  void create_edges(const WorkflowInput & input, WorkflowGraph & graph) const;
  static void resolve_link_pairs(WorkflowGraph & graph);
  /// (source, target) pairs that already carry a bridge edge.
  using BridgeSet = std::set<std::pair<std::string, std::string>>;

  static void bridge_link_pairs(WorkflowGraph & graph, BridgeSet & bridged);
  static void bridge_user_inputs(WorkflowGraph & graph, BridgeSet & bridged);
  static void add_bridge(
    WorkflowGraph & graph, BridgeSet & bridged, std::string id, const std::string & source,
    const std::string & target);
  static void compute_entry_nodes(WorkflowGraph & graph);

  static EdgeIndex append_edge(WorkflowGraph & graph, Edge edge);

  EdgeRuleTable rules_;
};

}  // namespace flowplan
