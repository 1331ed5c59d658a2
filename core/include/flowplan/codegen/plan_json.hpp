// flowplan/codegen/plan_json.hpp - JSON serialization for plans and graphs
//
// Returns nlohmann::json objects; callers decide on indentation.
//
#pragma once

#include <nlohmann/json.hpp>

#include "flowplan/basic/diagnostic.hpp"
#include "flowplan/graph/workflow_graph.hpp"
#include "flowplan/plan/hierarchy.hpp"

namespace flowplan
{

/**
 * Serialize a hierarchy.
 *
 * Leaves: {"type": "Leaf", "id", "name"}; wrappers:
 * {"type": "Sequence"|"Parallel", "id", "children": [...]}.
 */
[[nodiscard]] nlohmann::json to_json(const HierarchyNode & node);

/**
 * Serialize a graph with resolved edge semantics, link pairs and entry nodes.
 */
[[nodiscard]] nlohmann::json to_json(const WorkflowGraph & graph);

/**
 * Serialize collected diagnostics as an array.
 */
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diagnostics);

}  // namespace flowplan
