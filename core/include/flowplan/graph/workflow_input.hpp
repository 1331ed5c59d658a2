// flowplan/graph/workflow_input.hpp - Raw region-partitioned node/edge records
//
// This is what the compiler consumes. Producing these records from project
// files is the job of a loader (see io/workflow_reader.hpp for the JSON one).
//
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flowplan
{

struct RawNode
{
  std::string id;
  std::string type;  // raw canvas type, e.g. "agent", "prompt", "teleportOut"
  std::string name;
  nlohmann::json config = nlohmann::json::object();
};

struct RawEdge
{
  std::string id;
  std::string source;
  std::string target;
  std::optional<std::string> source_handle;
  std::optional<std::string> target_handle;
};

/**
 * A named partition of the workflow (a canvas tab).
 */
struct Region
{
  std::string id;
  std::string name;
  std::vector<RawNode> nodes;
  std::vector<RawEdge> edges;
};

struct WorkflowInput
{
  std::string name;
  std::vector<Region> regions;

  [[nodiscard]] size_t node_count() const noexcept
  {
    size_t n = 0;
    for (const auto & r : regions) n += r.nodes.size();
    return n;
  }

  [[nodiscard]] size_t edge_count() const noexcept
  {
    size_t n = 0;
    for (const auto & r : regions) n += r.edges.size();
    return n;
  }
};

/**
 * Resolved external content keyed by reference (usually a project-relative
 * path such as "prompts/writer.md").
 */
using ContentTable = std::map<std::string, std::string>;

}  // namespace flowplan
