// flowplan/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flowplan/basic/diagnostic.hpp"
#include "flowplan/graph/edge_semantics.hpp"
#include "flowplan/graph/workflow_graph.hpp"
#include "flowplan/graph/workflow_input.hpp"
#include "flowplan/plan/hierarchy.hpp"
#include "flowplan/project/project_config.hpp"
#include "flowplan/sema/validator.hpp"

namespace flowplan
{

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  /// Stop on validation errors. In lenient mode they are reported but
  /// synthesis still runs, unless the graph is cyclic.
  bool strict = true;

  ValidatorOptions validation;

  /// Edge rule table (defaults to EdgeRuleTable::defaults())
  std::optional<EdgeRuleTable> rules;

  /// Log pipeline stages to stderr
  bool verbose = false;

  /// Options derived from a project configuration
  static CompileOptions from_project(const ProjectConfig & config);
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Typed graph (absent if graph building failed)
  std::unique_ptr<WorkflowGraph> graph;

  /// Synthesized execution tree (absent on failure or with no tasks)
  std::optional<HierarchyNode> plan;

  /// All node ids in SEQUENTIAL order (empty if the graph is cyclic)
  std::vector<std::string> topological_order;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * The pipeline consists of:
 * 1. Graph building (fail-fast)
 * 2. Validation (fail-slow)
 * 3. Cycle gate and topological ordering
 * 4. Hierarchy synthesis from the entry nodes
 */
class Compiler
{
public:
  /**
   * Compile an in-memory workflow.
   *
   * Never throws for problems in the workflow; they are reported through
   * CompileResult::diagnostics.
   */
  [[nodiscard]] static CompileResult compile(
    const WorkflowInput & input, const ContentTable & content, const CompileOptions & options);

  /**
   * Load and compile a workflow file.
   */
  [[nodiscard]] static CompileResult compile_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Render a successful result in the given format.
   *
   * @param name Workflow name (tree ID, tree title)
   * @throws std::logic_error if the result has no plan
   */
  [[nodiscard]] static std::string render(
    const CompileResult & result, OutputFormat format, const std::string & name);

  /**
   * Render and write a result to `output_path`.
   *
   * @return true if the file was written; failures are reported to `diags`
   */
  static bool emit(
    const CompileResult & result, OutputFormat format, const std::string & name,
    const std::filesystem::path & output_path, DiagnosticBag & diags);

private:
  static bool synthesize(CompileResult & result, bool verbose);
};

}  // namespace flowplan
