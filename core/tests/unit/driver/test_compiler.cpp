// tests/unit/driver/test_compiler.cpp - End-to-end compile pipeline
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "flowplan/driver/compiler.hpp"
#include "flowplan/test_support/workflow_builder.hpp"

using namespace flowplan;
using flowplan::test_support::WorkflowBuilder;
namespace fs = std::filesystem;

namespace
{

CompileResult compile(const WorkflowBuilder & wb, CompileOptions options = {})
{
  return Compiler::compile(wb.input(), wb.content_table(), options);
}

bool has_code(const CompileResult & result, std::string_view code)
{
  for (const auto & d : result.diagnostics) {
    if (d.code == code) return true;
  }
  return false;
}

WorkflowBuilder diamond()
{
  WorkflowBuilder wb("diamond");
  wb.task("a", "Plan").task("b", "Research").task("c", "Draft").task("d", "Publish");
  wb.prompt("p", "prompts/shared.md");
  wb.feeds("p", "a").feeds("p", "b").feeds("p", "c").feeds("p", "d");
  wb.then("a", "b").then("a", "c").then("b", "d").then("c", "d");
  wb.content("prompts/shared.md", "Be concise.");
  return wb;
}

}  // namespace

// ============================================================================
// Pipeline
// ============================================================================

TEST(CompilerTest, CompilesDiamond)
{
  const CompileResult result = compile(diamond());

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_NE(result.graph, nullptr);
  ASSERT_TRUE(result.plan.has_value());
  EXPECT_EQ(result.plan->to_string(), "Sequence[a, Sequence[Parallel[b, c], d]]");
  EXPECT_EQ(result.topological_order.size(), 5U);
}

TEST(CompilerTest, StructuralErrorStopsBeforeValidation)
{
  WorkflowBuilder wb;
  wb.task("a").then("a", "ghost");
  const CompileResult result = compile(wb);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.graph, nullptr);
  EXPECT_FALSE(result.plan.has_value());
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].code, "E0101");
}

TEST(CompilerTest, StrictModeStopsOnValidationErrors)
{
  WorkflowBuilder wb;
  wb.task("a").prompt("p", "prompts/missing.md").feeds("p", "a");
  const CompileResult result = compile(wb);

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_code(result, "E0301"));
  EXPECT_FALSE(result.plan.has_value());
  EXPECT_TRUE(result.topological_order.empty());
}

TEST(CompilerTest, LenientModeStillSynthesizes)
{
  WorkflowBuilder wb;
  wb.task("a").prompt("p", "prompts/missing.md").feeds("p", "a");
  CompileOptions options;
  options.strict = false;
  const CompileResult result = compile(wb, options);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
  ASSERT_TRUE(result.plan.has_value());
  EXPECT_EQ(result.plan->to_string(), "a");
}

TEST(CompilerTest, CycleIsReportedOnceEvenWhenLenient)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").then("a", "b").then("b", "a");
  CompileOptions options;
  options.strict = false;
  const CompileResult result = compile(wb, options);

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.plan.has_value());
  EXPECT_EQ(result.diagnostics.of_kind(ErrorKind::Cycle).size(), 1U);
}

TEST(CompilerTest, UserInputPauseOrdersTasks)
{
  WorkflowBuilder wb;
  wb.task("a").node("ui", "userInput").task("b").then("a", "ui").then("ui", "b");
  const CompileResult result = compile(wb);

  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.plan.has_value());
  EXPECT_EQ(result.plan->to_string(), "Sequence[a, b]");
  EXPECT_EQ(result.topological_order, (std::vector<std::string>{"a", "ui", "b"}));
}

TEST(CompilerTest, NoTasksIsAnError)
{
  WorkflowBuilder wb;
  wb.prompt("p", "p.md").content("p.md", "text");
  const CompileResult result = compile(wb);

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_code(result, "E0404"));
}

TEST(CompilerTest, WarningsDoNotFailTheBuild)
{
  WorkflowBuilder wb;
  wb.task("a").task("b").then("a", "b").task("lonely");
  const CompileResult result = compile(wb);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.has_warnings());
  ASSERT_TRUE(result.plan.has_value());
  EXPECT_EQ(result.plan->to_string(), "Parallel[Sequence[a, b], lonely]");
}

TEST(CompilerTest, ProjectOptionsApplyRulesAndValidation)
{
  const ConfigLoadResult loaded = parse_project_config(R"(
compiler:
  strict: false
validation:
  check_output_keys: true
edge_rules:
  - source: task
    target: task
    semantics: sequential
    priority: 1
)");
  ASSERT_TRUE(loaded.success) << loaded.error;
  const CompileOptions options = CompileOptions::from_project(loaded.config);
  EXPECT_FALSE(options.strict);
  ASSERT_TRUE(options.rules.has_value());

  // Handle-less task edge is SEQUENTIAL only with the project rule.
  WorkflowBuilder wb;
  wb.task("a").task("b").edge("a", "b");
  const CompileResult result = compile(wb, options);

  ASSERT_TRUE(result.plan.has_value());
  EXPECT_EQ(result.plan->to_string(), "Sequence[a, b]");
  EXPECT_TRUE(has_code(result, "W0507"));
}

// ============================================================================
// Files and rendering
// ============================================================================

TEST(CompilerTest, CompileFileReportsFormatErrors)
{
  const fs::path file = fs::temp_directory_path() / "flowplan_compiler_bad.json";
  {
    std::ofstream out(file);
    out << "{ \"regions\": 3 }";
  }

  const CompileResult result = Compiler::compile_file(file, CompileOptions{});
  fs::remove(file);

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  const Diagnostic & d = result.diagnostics.all()[0];
  EXPECT_EQ(d.code, "E0001");
  ASSERT_TRUE(d.location.file_path.has_value());
  EXPECT_EQ(*d.location.file_path, file.string());
}

TEST(CompilerTest, CompileFileReadsPromptsFromDisk)
{
  const fs::path dir = fs::temp_directory_path() / "flowplan_compiler_project";
  fs::remove_all(dir);
  fs::create_directories(dir / "prompts");
  {
    std::ofstream out(dir / "flow.json");
    out << R"({"regions": [{"id": "main", "nodes": [
      {"id": "p", "type": "prompt", "config": {"file_path": "prompts/a.md"}},
      {"id": "a", "type": "agent", "name": "Writer"}],
      "edges": [{"source": "p", "target": "a"}]}]})";
  }
  {
    std::ofstream out(dir / "prompts" / "a.md");
    out << "Write.";
  }

  const CompileResult result = Compiler::compile_file(dir / "flow.json", CompileOptions{});
  fs::remove_all(dir);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(CompilerTest, RendersEveryFormat)
{
  const CompileResult result = compile(diamond());
  ASSERT_TRUE(result.success);

  const nlohmann::json j = nlohmann::json::parse(Compiler::render(result, OutputFormat::Json, "diamond"));
  EXPECT_EQ(j["name"], "diamond");
  EXPECT_EQ(j["plan"]["type"], "Sequence");
  EXPECT_EQ(j["order"].size(), 5U);

  const std::string xml = Compiler::render(result, OutputFormat::Xml, "diamond");
  EXPECT_NE(xml.find("main_tree_to_execute=\"diamond\""), std::string::npos);
  EXPECT_NE(xml.find("<Task ID=\"a\" name=\"Plan\" kind=\"task\"/>"), std::string::npos) << xml;

  const std::string tree = Compiler::render(result, OutputFormat::Tree, "diamond");
  EXPECT_EQ(tree.rfind("diamond\n└── Sequence\n", 0), 0U) << tree;
}

TEST(CompilerTest, RenderWithoutPlanThrows)
{
  const CompileResult empty{};
  EXPECT_THROW((void)Compiler::render(empty, OutputFormat::Json, "x"), std::logic_error);
}

TEST(CompilerTest, EmitWritesFileAndCreatesDirectories)
{
  const fs::path dir = fs::temp_directory_path() / "flowplan_compiler_emit";
  fs::remove_all(dir);
  const fs::path out = dir / "nested" / "diamond.txt";

  const CompileResult result = compile(diamond());
  DiagnosticBag diags;
  ASSERT_TRUE(Compiler::emit(result, OutputFormat::Tree, "diamond", out, diags));
  EXPECT_TRUE(diags.empty());

  std::ifstream in(out);
  std::stringstream text;
  text << in.rdbuf();
  EXPECT_EQ(text.str(), Compiler::render(result, OutputFormat::Tree, "diamond"));

  fs::remove_all(dir);
}

TEST(CompilerTest, EmitReportsMissingPlan)
{
  const CompileResult empty{};
  DiagnosticBag diags;
  EXPECT_FALSE(Compiler::emit(
    empty, OutputFormat::Json, "x", fs::temp_directory_path() / "flowplan_never.json", diags));
  EXPECT_TRUE(diags.has_errors());
}
