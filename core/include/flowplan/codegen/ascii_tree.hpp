// flowplan/codegen/ascii_tree.hpp - Human-readable topology of a plan
#pragma once

#include <string>

#include "flowplan/plan/hierarchy.hpp"

namespace flowplan
{

/**
 * Render a plan as an indented tree:
 *
 *   demo
 *   └── Sequence
 *       ├── Fetch (a)
 *       └── Parallel
 *           ├── Summarize (b)
 *           └── Translate (c)
 *
 * Every line, the last one included, ends with '\n'.
 */
[[nodiscard]] std::string render_ascii_tree(
  const HierarchyNode & plan, const std::string & title = "Workflow");

}  // namespace flowplan
