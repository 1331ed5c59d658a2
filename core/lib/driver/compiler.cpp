// flowplan/driver/compiler.cpp - Compiler driver implementation
//
#include "flowplan/driver/compiler.hpp"

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>
#include <utility>

#include "flowplan/basic/errors.hpp"
#include "flowplan/codegen/ascii_tree.hpp"
#include "flowplan/codegen/plan_json.hpp"
#include "flowplan/codegen/plan_xml.hpp"
#include "flowplan/graph/graph_builder.hpp"
#include "flowplan/graph/topological_sort.hpp"
#include "flowplan/io/workflow_reader.hpp"
#include "flowplan/plan/hierarchy_synthesizer.hpp"

namespace flowplan
{

namespace
{

void log_stage(bool verbose, const std::string & message)
{
  if (!verbose) return;
  fmt::print(stderr, "[flowplan] {}\n", message);
}

}  // namespace

CompileOptions CompileOptions::from_project(const ProjectConfig & config)
{
  CompileOptions options;
  options.strict = config.compiler.strict;
  options.validation = config.validation;
  options.rules = config.rule_table();
  return options;
}

CompileResult Compiler::compile(
  const WorkflowInput & input, const ContentTable & content, const CompileOptions & options)
{
  CompileResult result;

  // 1. Graph building
  log_stage(
    options.verbose, fmt::format(
                       "building graph: {} nodes, {} edges in {} regions", input.node_count(),
                       input.edge_count(), input.regions.size()));
  try {
    const GraphBuilder builder(options.rules.value_or(EdgeRuleTable::defaults()));
    result.graph = std::make_unique<WorkflowGraph>(builder.build(input));
  } catch (const CompileError & e) {
    result.diagnostics.add(e.to_diagnostic());
    return result;
  }

  const WorkflowGraph & graph = *result.graph;
  log_stage(
    options.verbose, fmt::format(
                       "graph: {} edges, {} link pairs, {} entry nodes", graph.edges().size(),
                       graph.link_pairs().size(), graph.entry_nodes().size()));

  // 2. Validation
  const WorkflowValidator validator(options.validation);
  ValidationResult validation = validator.validate(graph, content);
  log_stage(
    options.verbose, fmt::format(
                       "validation: {} errors, {} warnings", validation.errors().size(),
                       validation.warnings().size()));
  result.diagnostics.merge(std::move(validation.diagnostics));

  if (options.strict && result.diagnostics.has_errors()) {
    return result;
  }

  // 3. Cycle gate. The validator already reported the cycle.
  try {
    result.topological_order = topological_sort(graph);
  } catch (const CycleError & e) {
    if (result.diagnostics.of_kind(ErrorKind::Cycle).empty()) {
      result.diagnostics.add(e.to_diagnostic());
    }
    return result;
  }

  // 4. Synthesis
  if (!synthesize(result, options.verbose)) {
    return result;
  }

  // Lenient mode surfaces validation errors without failing the build.
  result.success = !options.strict || !result.diagnostics.has_errors();
  return result;
}

bool Compiler::synthesize(CompileResult & result, bool verbose)
{
  const WorkflowGraph & graph = *result.graph;

  const std::vector<std::string> & roots = graph.entry_nodes();
  if (roots.empty()) {
    result.diagnostics.error(ErrorKind::Structural, "E0404", Location{}, "no entry task")
      .with_help("connect at least one task that has no task predecessor");
    return false;
  }

  HierarchySynthesizer synthesizer(graph);
  result.plan = synthesizer.synthesize(roots);
  if (!result.plan) {
    result.diagnostics.error(
      ErrorKind::Internal, "", Location{}, "no task was placed in the plan");
    return false;
  }

  log_stage(
    verbose, fmt::format(
               "plan: {} tasks from {} roots, depth {}", synthesizer.placed().size(),
               roots.size(), result.plan->depth()));
  return true;
}

CompileResult Compiler::compile_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  log_stage(options.verbose, "loading " + file.string());

  WorkflowDocument doc;
  try {
    doc = load_workflow_file(file);
  } catch (const WorkflowFormatError & e) {
    CompileResult result;
    Location loc;
    loc.file_path = file.string();
    result.diagnostics.error(ErrorKind::Structural, "E0001", std::move(loc), e.what());
    return result;
  }

  return compile(doc.input, doc.content, options);
}

std::string Compiler::render(
  const CompileResult & result, OutputFormat format, const std::string & name)
{
  if (!result.plan) {
    throw std::logic_error("Compiler::render called on a result without a plan");
  }

  switch (format) {
    case OutputFormat::Json: {
      nlohmann::json doc{
        {"name", name},
        {"plan", to_json(*result.plan)},
        {"order", result.topological_order}};
      return doc.dump(2) + "\n";
    }
    case OutputFormat::Xml:
      return PlanXmlGenerator::generate(*result.plan, name, result.graph.get());
    case OutputFormat::Tree:
      return render_ascii_tree(*result.plan, name);
  }
  return {};
}

bool Compiler::emit(
  const CompileResult & result, OutputFormat format, const std::string & name,
  const std::filesystem::path & output_path, DiagnosticBag & diags)
{
  try {
    const std::string text = render(result, format, name);

    if (output_path.has_parent_path()) {
      std::filesystem::create_directories(output_path.parent_path());
    }

    std::ofstream out(output_path);
    if (!out.is_open()) {
      diags.error(
        ErrorKind::Internal, "", Location{}, "failed to open output file: " + output_path.string());
      return false;
    }

    out << text;
    return true;
  } catch (const std::exception & e) {
    diags.error(
      ErrorKind::Internal, "", Location{}, "plan generation failed: " + std::string(e.what()));
    return false;
  }
}

}  // namespace flowplan
