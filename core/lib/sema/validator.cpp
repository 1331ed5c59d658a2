// flowplan/sema/validator.cpp - Workflow validation rules
#include "flowplan/sema/validator.hpp"

#include <fmt/format.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "flowplan/basic/errors.hpp"
#include "flowplan/graph/topological_sort.hpp"

namespace flowplan
{

namespace
{

constexpr int64_t k_default_loop_iterations = 5;

bool is_isolated(const Node & node)
{
  return node.incoming.empty() && node.outgoing.empty();
}

const char * provider_label(NodeKind kind)
{
  switch (kind) {
    case NodeKind::Prompt:
      return "Prompt";
    case NodeKind::Context:
      return "Context";
    case NodeKind::Tool:
      return "Tool";
    case NodeKind::Variable:
      return "Variable";
    default:
      return "Node";
  }
}

const char * reference_label(NodeKind kind)
{
  switch (kind) {
    case NodeKind::Prompt:
      return "prompt";
    case NodeKind::Context:
      return "context";
    case NodeKind::Tool:
      return "tool";
    default:
      return "content";
  }
}

}  // namespace

ValidationResult WorkflowValidator::validate(
  const WorkflowGraph & graph, const ContentTable & content) const
{
  ValidationResult result;
  DiagnosticBag & diags = result.diagnostics;

  check_cycles(graph, diags);
  check_references(graph, content, diags);
  check_start_nodes(graph, diags);
  check_connectivity(graph, diags);
  check_tasks(graph, diags);
  if (options_.check_duplicate_names) {
    check_duplicate_names(graph, diags);
  }
  if (options_.check_output_keys) {
    check_output_keys(graph, diags);
  }

  return result;
}

// ============================================================================
// Errors
// ============================================================================

void WorkflowValidator::check_cycles(const WorkflowGraph & graph, DiagnosticBag & diags) const
{
  if (auto cycle = find_sequential_cycle(graph)) {
    CycleError err(std::move(*cycle));
    Diagnostic diag = err.to_diagnostic();
    if (const Node * first = graph.get_node(diag.location.node_id)) {
      diag.location = graph.location_of(*first);
    }
    diags.add(std::move(diag));
  }
}

void WorkflowValidator::check_references(
  const WorkflowGraph & graph, const ContentTable & content, DiagnosticBag & diags) const
{
  for (const auto & node : graph.nodes()) {
    if (!references_external_content(node.kind)) continue;

    const std::string path = node.config_string("file_path");
    if (path.empty() || content.count(path) > 0) continue;

    Location loc = graph.location_of(node);
    loc.file_path = path;
    diags
      .error(
        ErrorKind::Reference, "E0301", std::move(loc),
        fmt::format("missing {} reference '{}'", reference_label(node.kind), path))
      .noted("referenced here")
      .with_help("add the file to the project or fix the node's file_path");
  }
}

void WorkflowValidator::check_start_nodes(
  const WorkflowGraph & graph, DiagnosticBag & diags) const
{
  const auto starts = graph.nodes_of_kind(NodeKind::Start);
  if (starts.size() <= 1) return;

  diags
    .error(
      ErrorKind::Structural, "E0402", graph.location_of(*starts[1]),
      fmt::format("workflow has {} start nodes; only one is allowed", starts.size()))
    .noted("second start node")
    .see_also(graph.location_of(*starts[0]), "first start node");
}

void WorkflowValidator::check_duplicate_names(
  const WorkflowGraph & graph, DiagnosticBag & diags) const
{
  std::map<std::string, const Node *> first_by_name;
  for (const Node * node : graph.task_nodes()) {
    if (node->name.empty()) continue;

    auto [it, inserted] = first_by_name.emplace(node->name, node);
    if (inserted) continue;

    diags
      .error(
        ErrorKind::Config, "E0403", graph.location_of(*node),
        fmt::format("duplicate task name '{}'", node->name))
      .noted("redefined here")
      .see_also(graph.location_of(*it->second), "first used here")
      .with_help("task names must be unique within a workflow");
  }
}

// ============================================================================
// Warnings
// ============================================================================

void WorkflowValidator::check_connectivity(
  const WorkflowGraph & graph, DiagnosticBag & diags) const
{
  for (const auto & node : graph.nodes()) {
    if (node.is_task_like() && is_isolated(node)) {
      diags.warning(
        "W0501", graph.location_of(node),
        fmt::format("task '{}' has no connections (isolated node)", node.name));
      continue;
    }

    if (is_content_provider(node.kind) && node.outgoing.empty()) {
      diags.warning(
        "W0502", graph.location_of(node),
        fmt::format(
          "{} '{}' is not connected to any task", provider_label(node.kind), node.name));
    }
  }
}

void WorkflowValidator::check_tasks(const WorkflowGraph & graph, DiagnosticBag & diags) const
{
  for (const Node * node : graph.task_nodes()) {
    const Location loc = graph.location_of(*node);

    // Loop bounds are checked even on isolated nodes: a bad bound is an error.
    if (node->composite == CompositeKind::Loop) {
      const auto it = node->config.find("max_iterations");
      const bool present = it != node->config.end() && !it->is_null();
      if (present && (!it->is_number() || it->get<double>() <= 0.0)) {
        diags
          .error(
            ErrorKind::Config, "E0401", loc,
            fmt::format("loop '{}' has invalid max_iterations: {}", node->name, it->dump()))
          .noted("declared here")
          .with_help("max_iterations must be a positive number");
        continue;
      }
      const double bound = present ? it->get<double>() : k_default_loop_iterations;
      if (!is_isolated(*node) && bound > static_cast<double>(options_.max_loop_iterations)) {
        diags.warning(
          "W0505", loc,
          fmt::format(
            "loop '{}' has high max_iterations ({}); the limit is {}", node->name,
            present ? it->dump() : std::to_string(k_default_loop_iterations),
            options_.max_loop_iterations));
      }
    }

    if (is_isolated(*node)) continue;

    if (node->composite != CompositeKind::None) {
      const bool has_children = !graph.outgoing(*node, SemanticTag::Sequential).empty() ||
                                !graph.outgoing(*node, SemanticTag::Parallel).empty() ||
                                !graph.incoming(*node, SemanticTag::Subtask).empty();
      if (!has_children) {
        diags.warning(
          "W0504", loc,
          fmt::format(
            "{} composite '{}' has no sub-tasks", to_string(node->composite), node->name));
      }
      continue;
    }

    if (node->kind != NodeKind::Task) continue;

    size_t instructions = 0;
    size_t contexts = 0;
    for (const Edge * e : graph.incoming(*node, SemanticTag::InputData)) {
      if (e->semantics.input == InputKind::Instruction) ++instructions;
      if (e->semantics.input == InputKind::Context) ++contexts;
    }

    if (node->config_string("type", "llm") == "llm" && instructions == 0 && contexts == 0) {
      diags.warning(
        "W0503", loc, fmt::format("task '{}' has no connected prompt or context", node->name));
    }

    if (contexts > 1) {
      diags.warning(
        "W0506", loc,
        fmt::format(
          "task '{}' receives context from {} sources; later values may overwrite "
          "earlier ones",
          node->name, contexts));
    }
  }
}

void WorkflowValidator::check_output_keys(
  const WorkflowGraph & graph, DiagnosticBag & diags) const
{
  for (const Node * node : graph.task_nodes()) {
    if (node->kind != NodeKind::Task) continue;
    if (!node->config_string("output_key").empty()) continue;

    for (const Edge * e : graph.outgoing(*node, SemanticTag::Sequential)) {
      const Node * target = graph.get_node(e->target_id);
      if (e->is_virtual() || target == nullptr || target->kind != NodeKind::Task) continue;

      diags
        .warning(
          "W0507", graph.location_of(*node),
          fmt::format(
            "task '{}' outputs to '{}' but has no output_key", node->name, target->name))
        .with_help("set output_key so the receiving task can read this output");
      break;
    }
  }
}

}  // namespace flowplan
