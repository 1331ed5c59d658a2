// tests/unit/project/test_project_config.cpp - flowplan.yaml parsing
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "flowplan/project/project_config.hpp"

using namespace flowplan;
namespace fs = std::filesystem;

TEST(ProjectConfigTest, EmptyDocumentUsesDefaults)
{
  const ConfigLoadResult result = parse_project_config("");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & config = result.config;
  EXPECT_FALSE(config.compiler.entry.has_value());
  EXPECT_EQ(config.compiler.output_dir, fs::path("generated"));
  EXPECT_EQ(config.compiler.format, OutputFormat::Json);
  EXPECT_TRUE(config.compiler.strict);
  EXPECT_EQ(config.validation.max_loop_iterations, 100);
  EXPECT_FALSE(config.validation.check_output_keys);
  EXPECT_TRUE(config.validation.check_duplicate_names);
  EXPECT_TRUE(config.edge_rules.empty());
}

TEST(ProjectConfigTest, ParsesAllSections)
{
  const std::string yaml = R"(
package:
  name: nightly
  version: '1.2.0'
compiler:
  entry: flows/main.json
  output_dir: out
  format: xml
  strict: false
validation:
  max_loop_iterations: 20
  check_output_keys: true
  check_duplicate_names: false
)";

  const ConfigLoadResult result = parse_project_config(yaml, "/work/project");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & config = result.config;
  EXPECT_EQ(config.package.name, "nightly");
  EXPECT_EQ(config.package.version, "1.2.0");
  ASSERT_TRUE(config.compiler.entry.has_value());
  EXPECT_EQ(*config.compiler.entry, fs::path("flows/main.json"));
  EXPECT_EQ(config.compiler.output_dir, fs::path("out"));
  EXPECT_EQ(config.compiler.format, OutputFormat::Xml);
  EXPECT_FALSE(config.compiler.strict);
  EXPECT_EQ(config.validation.max_loop_iterations, 20);
  EXPECT_TRUE(config.validation.check_output_keys);
  EXPECT_FALSE(config.validation.check_duplicate_names);
  EXPECT_EQ(config.project_root, fs::path("/work/project"));
}

TEST(ProjectConfigTest, RejectsUnknownFormat)
{
  const ConfigLoadResult result = parse_project_config("compiler:\n  format: yaml\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid compiler.format"), std::string::npos);
}

TEST(ProjectConfigTest, RejectsNonPositiveLoopLimit)
{
  const ConfigLoadResult result =
    parse_project_config("validation:\n  max_loop_iterations: 0\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "validation.max_loop_iterations must be positive");
}

TEST(ProjectConfigTest, ReportsYamlSyntaxErrors)
{
  const ConfigLoadResult result = parse_project_config("compiler: [unclosed\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML", 0), 0U) << result.error;
}

TEST(ProjectConfigTest, OutputFormatHelpers)
{
  EXPECT_EQ(parse_output_format("tree"), OutputFormat::Tree);
  EXPECT_FALSE(parse_output_format("TREE").has_value());
  EXPECT_STREQ(to_string(OutputFormat::Xml), "xml");
  EXPECT_STREQ(file_extension(OutputFormat::Json), ".plan.json");
  EXPECT_STREQ(file_extension(OutputFormat::Tree), ".txt");
}

// ============================================================================
// Edge rules
// ============================================================================

TEST(ProjectConfigTest, EdgeRulesExtendDefaults)
{
  const std::string yaml = R"(
edge_rules:
  - source: task
    target: task
    source_handle: next
    target_handle: prev
    semantics: sequential
)";
  const ConfigLoadResult result = parse_project_config(yaml);
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.config.edge_rules.size(), 1U);

  const EdgeRule & rule = result.config.edge_rules[0].rule;
  EXPECT_EQ(rule.priority, 10);
  EXPECT_FALSE(result.config.edge_rules[0].replace);

  const EdgeRuleTable table = result.config.rule_table();
  EXPECT_EQ(
    table.resolve(NodeKind::Task, NodeKind::Task, std::string("next"), std::string("prev")),
    EdgeSemantics::of(SemanticTag::Sequential));
  // Defaults are still present
  EXPECT_EQ(
    table.resolve(NodeKind::Task, NodeKind::Task, std::string("output"), std::string("input")),
    EdgeSemantics::of(SemanticTag::Sequential));
}

TEST(ProjectConfigTest, ReplaceDropsDefaultsForPair)
{
  const std::string yaml = R"(
edge_rules:
  - source: variable
    target: task
    semantics: input_data:instruction
    replace: true
)";
  const ConfigLoadResult result = parse_project_config(yaml);
  ASSERT_TRUE(result.success) << result.error;

  const EdgeRuleTable table = result.config.rule_table();
  EXPECT_EQ(
    table.resolve(NodeKind::Variable, NodeKind::Task),
    EdgeSemantics::input_data(InputKind::Instruction));
}

TEST(ProjectConfigTest, RejectsBadEdgeRules)
{
  auto bad_kind = parse_project_config(
    "edge_rules:\n  - source: widget\n    target: task\n    semantics: sequential\n");
  EXPECT_FALSE(bad_kind.success);
  EXPECT_EQ(bad_kind.error, "invalid edge rule: unknown node kind 'widget'");

  auto bad_semantics = parse_project_config(
    "edge_rules:\n  - source: task\n    target: task\n    semantics: sideways\n");
  EXPECT_FALSE(bad_semantics.success);

  auto missing = parse_project_config("edge_rules:\n  - source: task\n");
  EXPECT_FALSE(missing.success);

  auto not_list = parse_project_config("edge_rules:\n  source: task\n");
  EXPECT_FALSE(not_list.success);
  EXPECT_EQ(not_list.error, "edge_rules must be a list");
}

// ============================================================================
// Files
// ============================================================================

TEST(ProjectConfigTest, FindsConfigInParentDirectory)
{
  const fs::path root = fs::temp_directory_path() / "flowplan_project_config_find";
  fs::remove_all(root);
  fs::create_directories(root / "flows" / "nested");
  {
    std::ofstream out(root / k_project_config_file_name);
    out << "package:\n  name: found\ncompiler:\n  entry: flows/main.json\n";
  }

  const auto found = find_project_config(root / "flows" / "nested");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(root / k_project_config_file_name));

  const ConfigLoadResult loaded = load_project_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.package.name, "found");
  EXPECT_EQ(fs::canonical(loaded.config.project_root), fs::canonical(root));

  fs::remove_all(root);
}

TEST(ProjectConfigTest, MissingFileFails)
{
  const ConfigLoadResult result =
    load_project_config(fs::temp_directory_path() / "flowplan_does_not_exist" / "flowplan.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("configuration file not found", 0), 0U);
}
