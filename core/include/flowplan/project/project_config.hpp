// flowplan/project/project_config.hpp - Project configuration (flowplan.yaml)
//
// Parses and validates flowplan.yaml project configuration files.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "flowplan/graph/edge_semantics.hpp"
#include "flowplan/sema/validator.hpp"

namespace flowplan
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Output format of `flowplan build`.
 */
enum class OutputFormat : uint8_t {
  Json,
  Xml,
  Tree,
};

[[nodiscard]] std::optional<OutputFormat> parse_output_format(const std::string & name);
[[nodiscard]] const char * to_string(OutputFormat format) noexcept;

/// File extension (with leading dot) used for an output format.
[[nodiscard]] const char * file_extension(OutputFormat format) noexcept;

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Workflow file to compile when none is given on the command line
  std::optional<std::filesystem::path> entry;

  /// Output directory for generated files
  std::filesystem::path output_dir = "generated";

  OutputFormat format = OutputFormat::Json;

  /// Stop on validation errors
  bool strict = true;
};

/**
 * One entry of the `edge_rules` section.
 */
struct EdgeRuleConfig
{
  EdgeRule rule;

  /// Drop the existing rules for this kind pair before adding
  bool replace = false;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (flowplan.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;
  ValidatorOptions validation;

  /// Rules applied, in order, on top of the default edge rule table
  std::vector<EdgeRuleConfig> edge_rules;

  /// Directory containing flowplan.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Default rule table with `edge_rules` applied
  [[nodiscard]] EdgeRuleTable rule_table() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a flowplan.yaml file.
 *
 * @param config_path Path to flowplan.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse project configuration from YAML text.
 *
 * @param yaml_text Contents of a flowplan.yaml file
 * @param project_root Directory used to resolve relative paths
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root = {});

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to flowplan.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "flowplan.yaml";

}  // namespace flowplan
