// flowplan/graph/topological_sort.hpp - SEQUENTIAL-edge ordering and cycle detection
//
// Loops are expressed with a loop composite node, never with a cycle of
// edges, so any SEQUENTIAL cycle is an authoring error. The hierarchy
// synthesizer must only be run on a graph that passed this check.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "flowplan/graph/workflow_graph.hpp"

namespace flowplan
{

/**
 * Order all node ids so that every node precedes its SEQUENTIAL successors.
 *
 * The DFS is driven from every unvisited node in insertion order, so
 * components unreachable from the entry nodes are ordered too. The result is
 * the reverse of the DFS finish order.
 *
 * @throws CycleError if the SEQUENTIAL subgraph contains a cycle
 */
[[nodiscard]] std::vector<std::string> topological_sort(const WorkflowGraph & graph);

/**
 * Find a SEQUENTIAL cycle, if any.
 *
 * @return The cycle as node ids, closed by repeating the first id, or
 *         std::nullopt when the SEQUENTIAL subgraph is acyclic
 */
[[nodiscard]] std::optional<std::vector<std::string>> find_sequential_cycle(
  const WorkflowGraph & graph);

}  // namespace flowplan
