// flowplan/codegen/plan_json.cpp - JSON serialization implementation
//
#include "flowplan/codegen/plan_json.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace flowplan
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_optional(const std::optional<std::string> & s)
{
  if (!s) return nullptr;
  return *s;
}

json j_location(const Location & loc)
{
  json j = json::object();
  if (loc.has_node()) {
    j["node_id"] = loc.node_id;
    j["node_name"] = loc.node_name;
  }
  if (loc.has_region()) {
    j["region_id"] = loc.region_id;
    j["region_name"] = loc.region_name;
  }
  if (loc.file_path) {
    j["file_path"] = *loc.file_path;
    if (loc.line > 0) j["line"] = loc.line;
  }
  return j;
}

json j_node(const Node & node)
{
  json j{
    {"id", node.id},
    {"kind", to_string(node.kind)},
    {"type", node.raw_type},
    {"name", node.name},
    {"region", node.region_id}};
  if (node.composite != CompositeKind::None) {
    j["composite"] = to_string(node.composite);
  }
  if (!node.config.empty()) {
    j["config"] = node.config;
  }
  return j;
}

json j_edge(const Edge & edge)
{
  return json{
    {"id", edge.id},
    {"source", edge.source_id},
    {"target", edge.target_id},
    {"sourceHandle", j_optional(edge.source_handle)},
    {"targetHandle", j_optional(edge.target_handle)},
    {"semantics", to_string(edge.semantics)},
    {"virtual", edge.is_virtual()}};
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const HierarchyNode & node)
{
  if (node.is_leaf()) {
    return json{{"type", "Leaf"}, {"id", node.id}, {"name", node.name}};
  }

  json children = json::array();
  for (const auto & child : node.children) {
    children.push_back(to_json(child));
  }
  return json{{"type", to_string(node.kind)}, {"id", node.id}, {"children", std::move(children)}};
}

nlohmann::json to_json(const WorkflowGraph & graph)
{
  json nodes = json::array();
  for (const auto & n : graph.nodes()) {
    nodes.push_back(j_node(n));
  }

  json edges = json::array();
  for (const auto & e : graph.edges()) {
    edges.push_back(j_edge(e));
  }

  json links = json::array();
  for (const auto & lp : graph.link_pairs()) {
    links.push_back(json{{"name", lp.name}, {"out", lp.out_node_id}, {"in", lp.in_node_id}});
  }

  return json{
    {"nodes", std::move(nodes)},
    {"edges", std::move(edges)},
    {"link_pairs", std::move(links)},
    {"entry_nodes", graph.entry_nodes()}};
}

nlohmann::json to_json(const DiagnosticBag & diagnostics)
{
  json out = json::array();
  for (const auto & d : diagnostics) {
    json j{
      {"severity", to_string(d.severity)},
      {"kind", to_string(d.kind)},
      {"code", d.code},
      {"message", d.message},
      {"location", j_location(d.location)}};
    if (!d.note.empty()) {
      j["note"] = d.note;
    }
    if (!d.related.empty()) {
      json related = json::array();
      for (const auto & r : d.related) {
        related.push_back({{"note", r.note}, {"location", j_location(r.location)}});
      }
      j["related"] = std::move(related);
    }
    if (d.help) {
      j["help"] = *d.help;
    }
    out.push_back(std::move(j));
  }
  return out;
}

}  // namespace flowplan
