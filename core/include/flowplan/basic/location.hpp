// flowplan/basic/location.hpp - Author-facing location of a workflow element
//
// Workflows are authored on a canvas, not in text, so a location names the
// node and the region ("tab") it lives in. Content-provider nodes may
// additionally point into an external file.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace flowplan
{

// ============================================================================
// Location
// ============================================================================

/**
 * Location of a diagnostic or error inside a workflow.
 *
 * All fields are optional; a default-constructed Location refers to the
 * workflow as a whole.
 */
struct Location
{
  std::string node_id;
  std::string node_name;
  std::string region_id;
  std::string region_name;

  /// External file referenced by the node (prompt, tool, ...)
  std::optional<std::string> file_path;

  /// 1-indexed line inside file_path (0 = unknown)
  uint32_t line = 0;

  /// Location of a single node
  static Location at_node(std::string node_id, std::string region_id = {})
  {
    Location loc;
    loc.node_id = std::move(node_id);
    loc.region_id = std::move(region_id);
    return loc;
  }

  /// Check if this refers to a specific node
  [[nodiscard]] bool has_node() const noexcept { return !node_id.empty(); }

  /// Check if this refers to a specific region
  [[nodiscard]] bool has_region() const noexcept { return !region_id.empty(); }

  /// Check if this refers to anything more specific than the whole workflow
  [[nodiscard]] bool is_valid() const noexcept
  {
    return has_node() || has_region() || file_path.has_value();
  }

  /// Human-readable single-line form, e.g. "region 'Main' (tab1) / node 'A' (n1)"
  [[nodiscard]] std::string to_string() const;
};

}  // namespace flowplan
