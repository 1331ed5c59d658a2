// flowplan/sema/validator.hpp - Fail-slow workflow validation
//
// Runs independently of synthesis over an already built graph and collects
// every problem it finds. Errors are fatal to compilation in strict mode;
// warnings never are.
//
#pragma once

#include <cstdint>

#include "flowplan/basic/diagnostic.hpp"
#include "flowplan/graph/workflow_graph.hpp"
#include "flowplan/graph/workflow_input.hpp"

namespace flowplan
{

struct ValidatorOptions
{
  /// Loop composites above this bound get a warning.
  int64_t max_loop_iterations = 100;

  /// Warn when a task feeds another task but declares no `output_key`.
  bool check_output_keys = false;

  /// Reject task-like nodes sharing a display name.
  bool check_duplicate_names = true;
};

/**
 * Collected diagnostics of one validation run.
 */
struct ValidationResult
{
  DiagnosticBag diagnostics;

  [[nodiscard]] bool valid() const { return !diagnostics.has_errors(); }
  [[nodiscard]] std::vector<Diagnostic> errors() const { return diagnostics.errors(); }
  [[nodiscard]] std::vector<Diagnostic> warnings() const { return diagnostics.warnings(); }
};

class WorkflowValidator
{
public:
  WorkflowValidator() = default;
  explicit WorkflowValidator(ValidatorOptions options) : options_(options) {}

  /**
   * Validate a graph against the available external content.
   *
   * Never throws for problems in the workflow itself; every finding is
   * returned in the result.
   */
  [[nodiscard]] ValidationResult validate(
    const WorkflowGraph & graph, const ContentTable & content) const;

  [[nodiscard]] const ValidatorOptions & options() const noexcept { return options_; }

private:
  void check_cycles(const WorkflowGraph & graph, DiagnosticBag & diags) const;
  void check_references(
    const WorkflowGraph & graph, const ContentTable & content, DiagnosticBag & diags) const;
  void check_start_nodes(const WorkflowGraph & graph, DiagnosticBag & diags) const;
  void check_connectivity(const WorkflowGraph & graph, DiagnosticBag & diags) const;
  void check_tasks(const WorkflowGraph & graph, DiagnosticBag & diags) const;
  void check_duplicate_names(const WorkflowGraph & graph, DiagnosticBag & diags) const;
  void check_output_keys(const WorkflowGraph & graph, DiagnosticBag & diags) const;

  ValidatorOptions options_;
};

}  // namespace flowplan
