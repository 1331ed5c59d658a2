// flowplan/io/workflow_reader.cpp - JSON workflow loader
//
#include "flowplan/io/workflow_reader.hpp"

#include <fmt/format.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <system_error>

#include "flowplan/graph/node_kind.hpp"

namespace flowplan
{

namespace
{

using nlohmann::json;

std::string child_path(const std::string & parent, std::string_view key)
{
  return parent + "/" + std::string(key);
}

std::string child_path(const std::string & parent, size_t index)
{
  return parent + "/" + std::to_string(index);
}

const json & require_array(const json & obj, const char * key, const std::string & where)
{
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_array()) {
    throw WorkflowFormatError(fmt::format("'{}' must be an array", key), where);
  }
  return *it;
}

std::string require_string(const json & obj, const char * key, const std::string & where)
{
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    throw WorkflowFormatError(fmt::format("'{}' must be a string", key), where);
  }
  std::string value = it->get<std::string>();
  if (value.empty()) {
    throw WorkflowFormatError(fmt::format("'{}' must not be empty", key), where);
  }
  return value;
}

std::optional<std::string> optional_string(
  const json & obj, const char * key, const std::string & where)
{
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return std::nullopt;
  if (!it->is_string()) {
    throw WorkflowFormatError(fmt::format("'{}' must be a string", key), where);
  }
  return it->get<std::string>();
}

RawNode parse_node(const json & j, const std::string & where)
{
  if (!j.is_object()) {
    throw WorkflowFormatError("node must be an object", where);
  }

  RawNode node;
  node.id = require_string(j, "id", where);
  node.type = require_string(j, "type", where);

  // Canvas exports nest the configuration under "data".
  const auto cfg = j.contains("config") ? j.find("config") : j.find("data");
  if (cfg != j.end() && !cfg->is_null()) {
    if (!cfg->is_object()) {
      throw WorkflowFormatError("'config' must be an object", where);
    }
    node.config = *cfg;
  }

  if (auto name = optional_string(j, "name", where)) {
    node.name = std::move(*name);
  } else if (node.config.contains("name") && node.config["name"].is_string()) {
    node.name = node.config["name"].get<std::string>();
  }
  return node;
}

RawEdge parse_edge(const json & j, size_t index, const std::string & where)
{
  if (!j.is_object()) {
    throw WorkflowFormatError("edge must be an object", where);
  }

  RawEdge edge;
  edge.source = require_string(j, "source", where);
  edge.target = require_string(j, "target", where);
  edge.id = optional_string(j, "id", where).value_or(fmt::format("edge_{}", index));
  edge.source_handle = optional_string(j, "sourceHandle", where);
  edge.target_handle = optional_string(j, "targetHandle", where);
  return edge;
}

Region parse_region(const json & j, size_t index, const std::string & where)
{
  if (!j.is_object()) {
    throw WorkflowFormatError("region must be an object", where);
  }

  Region region;
  region.id = optional_string(j, "id", where).value_or(fmt::format("region_{}", index));
  region.name = optional_string(j, "name", where).value_or(region.id);

  const json & nodes = require_array(j, "nodes", where);
  const std::string nodes_path = child_path(where, "nodes");
  for (size_t i = 0; i < nodes.size(); ++i) {
    region.nodes.push_back(parse_node(nodes[i], child_path(nodes_path, i)));
  }

  if (j.contains("edges")) {
    const json & edges = require_array(j, "edges", where);
    const std::string edges_path = child_path(where, "edges");
    for (size_t i = 0; i < edges.size(); ++i) {
      region.edges.push_back(parse_edge(edges[i], i, child_path(edges_path, i)));
    }
  }
  return region;
}

/// Contents of a regular file; std::nullopt when it is missing, not a
/// regular file, or cannot be inspected or read.
std::optional<std::string> read_text_file(const std::filesystem::path & path)
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) return std::nullopt;

  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

WorkflowDocument read_workflow_json(std::string_view text)
{
  json root;
  try {
    root = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    throw WorkflowFormatError(fmt::format("invalid JSON: {}", e.what()));
  }

  if (!root.is_object()) {
    throw WorkflowFormatError("workflow document must be an object");
  }

  WorkflowDocument doc;
  doc.input.name = optional_string(root, "name", "").value_or("workflow");

  const json & regions = require_array(root, "regions", "");
  for (size_t i = 0; i < regions.size(); ++i) {
    doc.input.regions.push_back(parse_region(regions[i], i, child_path("/regions", i)));
  }

  if (root.contains("content")) {
    const json & content = root["content"];
    if (!content.is_object()) {
      throw WorkflowFormatError("'content' must be an object", "/content");
    }
    for (const auto & item : content.items()) {
      if (!item.value().is_string()) {
        throw WorkflowFormatError(
          "content entries must be strings", child_path("/content", item.key()));
      }
      doc.content.emplace(item.key(), item.value().get<std::string>());
    }
  }

  return doc;
}

WorkflowDocument load_workflow_file(const std::filesystem::path & path)
{
  const std::optional<std::string> text = read_text_file(path);
  if (!text) {
    throw WorkflowFormatError("cannot read workflow file: " + path.string());
  }

  WorkflowDocument doc = read_workflow_json(*text);

  const std::filesystem::path base = path.parent_path();
  for (const auto & region : doc.input.regions) {
    for (const auto & node : region.nodes) {
      if (!references_external_content(node_kind_from_string(node.type, node.config))) continue;

      const auto it = node.config.find("file_path");
      if (it == node.config.end() || !it->is_string()) continue;

      const std::string ref = it->get<std::string>();
      if (ref.empty() || doc.content.count(ref) > 0) continue;

      if (auto body = read_text_file(base / ref)) {
        doc.content.emplace(ref, std::move(*body));
      }
    }
  }

  return doc;
}

}  // namespace flowplan
