// flowplan/project/project_config.cpp - Project configuration implementation
//
#include "flowplan/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace flowplan
{

std::optional<OutputFormat> parse_output_format(const std::string & name)
{
  if (name == "json") return OutputFormat::Json;
  if (name == "xml") return OutputFormat::Xml;
  if (name == "tree") return OutputFormat::Tree;
  return std::nullopt;
}

const char * to_string(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::Json:
      return "json";
    case OutputFormat::Xml:
      return "xml";
    case OutputFormat::Tree:
      return "tree";
  }
  return "json";
}

const char * file_extension(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::Json:
      return ".plan.json";
    case OutputFormat::Xml:
      return ".xml";
    case OutputFormat::Tree:
      return ".txt";
  }
  return ".plan.json";
}

EdgeRuleTable ProjectConfig::rule_table() const
{
  EdgeRuleTable table = EdgeRuleTable::defaults();
  for (const auto & entry : edge_rules) {
    if (entry.replace) {
      table.remove_rules_for(entry.rule.source_kind, entry.rule.target_kind);
    }
    table.add_rule(entry.rule);
  }
  return table;
}

namespace
{

/// Parse a single edge rule entry
std::optional<EdgeRuleConfig> parse_edge_rule(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "edge rule entry must be a map";
    return std::nullopt;
  }

  if (!node["source"] || !node["target"] || !node["semantics"]) {
    error = "edge rule must have 'source', 'target' and 'semantics'";
    return std::nullopt;
  }

  EdgeRuleConfig entry;

  const auto source = node["source"].as<std::string>();
  const auto source_kind = parse_node_kind(source);
  if (!source_kind) {
    error = "unknown node kind '" + source + "'";
    return std::nullopt;
  }
  entry.rule.source_kind = *source_kind;

  const auto target = node["target"].as<std::string>();
  const auto target_kind = parse_node_kind(target);
  if (!target_kind) {
    error = "unknown node kind '" + target + "'";
    return std::nullopt;
  }
  entry.rule.target_kind = *target_kind;

  const auto semantics = node["semantics"].as<std::string>();
  const auto parsed = parse_edge_semantics(semantics);
  if (!parsed) {
    error = "unknown edge semantics '" + semantics + "'";
    return std::nullopt;
  }
  entry.rule.semantics = *parsed;

  if (node["source_handle"]) {
    entry.rule.source_handle = node["source_handle"].as<std::string>();
  }
  if (node["target_handle"]) {
    entry.rule.target_handle = node["target_handle"].as<std::string>();
  }

  entry.rule.priority = node["priority"] ? node["priority"].as<int>() : 10;

  if (node["replace"]) {
    entry.replace = node["replace"].as<bool>();
  }

  return entry;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  if (!root.IsNull() && !root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  ProjectConfig config;
  config.project_root = project_root;

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'compiler' section
  if (root["compiler"]) {
    const auto & comp = root["compiler"];

    if (comp["entry"]) {
      config.compiler.entry = comp["entry"].as<std::string>();
    }

    if (comp["output_dir"]) {
      config.compiler.output_dir = comp["output_dir"].as<std::string>();
    }

    if (comp["format"]) {
      const auto name = comp["format"].as<std::string>();
      const auto format = parse_output_format(name);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid compiler.format: '" + name + "' (must be 'json', 'xml' or 'tree')");
      }
      config.compiler.format = *format;
    }

    if (comp["strict"]) {
      config.compiler.strict = comp["strict"].as<bool>();
    }
  }

  // Parse 'validation' section
  if (root["validation"]) {
    const auto & val = root["validation"];

    if (val["max_loop_iterations"]) {
      config.validation.max_loop_iterations = val["max_loop_iterations"].as<int64_t>();
      if (config.validation.max_loop_iterations <= 0) {
        return ConfigLoadResult::fail("validation.max_loop_iterations must be positive");
      }
    }
    if (val["check_output_keys"]) {
      config.validation.check_output_keys = val["check_output_keys"].as<bool>();
    }
    if (val["check_duplicate_names"]) {
      config.validation.check_duplicate_names = val["check_duplicate_names"].as<bool>();
    }
  }

  // Parse 'edge_rules' section
  if (root["edge_rules"]) {
    if (!root["edge_rules"].IsSequence()) {
      return ConfigLoadResult::fail("edge_rules must be a list");
    }
    for (const auto & rule_node : root["edge_rules"]) {
      std::string rule_error;
      auto rule = parse_edge_rule(rule_node, rule_error);
      if (!rule) {
        return ConfigLoadResult::fail("invalid edge rule: " + rule_error);
      }
      config.edge_rules.push_back(std::move(*rule));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    return parse_root(
      YAML::LoadFile(config_path.string()), fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace flowplan
