// flowplan/graph/graph_builder.cpp - Graph construction and link resolution
#include "flowplan/graph/graph_builder.hpp"

#include <fmt/core.h>

#include <set>
#include <tuple>
#include <unordered_map>
#include <utility>

#include "flowplan/basic/errors.hpp"

namespace flowplan
{

namespace
{

/// Link name: explicit config `name`, else the display name.
std::string link_name(const Node & node)
{
  std::string name = node.config_string("name");
  if (name.empty()) {
    name = node.name;
  }
  return name;
}

struct LinkKey
{
  std::string region_id;
  std::string name;

  bool operator<(const LinkKey & other) const
  {
    return std::tie(region_id, name) < std::tie(other.region_id, other.name);
  }
};

bool is_flow_marker(NodeKind kind)
{
  return kind == NodeKind::Start || kind == NodeKind::UserInput;
}

}  // namespace

WorkflowGraph GraphBuilder::build(const WorkflowInput & input) const
{
  WorkflowGraph graph;
  create_nodes(input, graph);
  create_edges(input, graph);
  resolve_link_pairs(graph);

  BridgeSet bridged;
  bridge_link_pairs(graph, bridged);
  bridge_user_inputs(graph, bridged);
  compute_entry_nodes(graph);
  return graph;
}

void GraphBuilder::create_nodes(const WorkflowInput & input, WorkflowGraph & graph) const
{
  graph.nodes_.reserve(input.node_count());
  graph.index_.reserve(input.node_count());

  for (const auto & region : input.regions) {
    graph.region_names_.emplace(region.id, region.name);

    for (const auto & raw : region.nodes) {
      if (graph.index_.count(raw.id) > 0) {
        Location loc = Location::at_node(raw.id, region.id);
        loc.node_name = raw.name;
        loc.region_name = region.name;
        throw StructuralError("E0103", fmt::format("duplicate node id '{}'", raw.id), loc);
      }

      Node node;
      node.id = raw.id;
      node.raw_type = raw.type;
      node.kind = node_kind_from_string(raw.type, raw.config);
      node.composite = composite_kind_from_string(raw.type, raw.config);
      node.name = raw.name.empty() ? fmt::format("{}_{}", raw.type, raw.id) : raw.name;
      node.region_id = region.id;
      node.config = raw.config.is_object() ? raw.config : nlohmann::json::object();

      graph.index_.emplace(node.id, graph.nodes_.size());
      graph.nodes_.push_back(std::move(node));
    }
  }
}

void GraphBuilder::create_edges(const WorkflowInput & input, WorkflowGraph & graph) const
{
  graph.edges_.reserve(input.edge_count());

  for (const auto & region : input.regions) {
    for (const auto & raw : region.edges) {
      const Node * source = graph.get_node(raw.source);
      const Node * target = graph.get_node(raw.target);

      if (source == nullptr || target == nullptr) {
        const std::string & missing = source == nullptr ? raw.source : raw.target;
        Location loc;
        loc.region_id = region.id;
        loc.region_name = region.name;
        throw StructuralError(
          "E0101",
          fmt::format(
            "edge '{}' references unknown {} node '{}'", raw.id,
            source == nullptr ? "source" : "target", missing),
          loc);
      }

      Edge edge;
      edge.id = raw.id;
      edge.source_id = raw.source;
      edge.target_id = raw.target;
      edge.source_handle = raw.source_handle;
      edge.target_handle = raw.target_handle;
      edge.semantics =
        rules_.resolve(source->kind, target->kind, raw.source_handle, raw.target_handle);
      edge.origin = raw;

      append_edge(graph, std::move(edge));
    }
  }
}

void GraphBuilder::resolve_link_pairs(WorkflowGraph & graph)
{
  // Per-region namespaces for duplicate detection.
  std::set<LinkKey> seen_out;
  std::set<LinkKey> seen_in;

  // Name -> nodes, in encounter order.
  std::vector<std::pair<std::string, const Node *>> outs;
  std::unordered_map<std::string, std::vector<const Node *>> ins_by_name;

  for (const auto & node : graph.nodes_) {
    if (node.kind != NodeKind::LinkOut && node.kind != NodeKind::LinkIn) {
      continue;
    }
    const std::string name = link_name(node);
    if (name.empty()) {
      continue;
    }

    const bool is_out = node.kind == NodeKind::LinkOut;
    auto & seen = is_out ? seen_out : seen_in;
    if (!seen.insert(LinkKey{node.region_id, name}).second) {
      throw StructuralError(
        "E0102",
        fmt::format(
          "duplicate {} link named '{}' in region '{}'", is_out ? "outbound" : "inbound", name,
          node.region_id),
        graph.location_of(node));
    }

    if (is_out) {
      outs.emplace_back(name, &node);
    } else {
      ins_by_name[name].push_back(&node);
    }
  }

  for (const auto & [name, out_node] : outs) {
    const auto it = ins_by_name.find(name);
    if (it == ins_by_name.end()) {
      continue;
    }
    for (const Node * in_node : it->second) {
      graph.link_pairs_.push_back(LinkPair{name, out_node->id, in_node->id});
    }
  }
}

void GraphBuilder::bridge_link_pairs(WorkflowGraph & graph, BridgeSet & bridged)
{
  for (const auto & pair : graph.link_pairs_) {
    // Collect ids first: appending edges mutates the node edge lists.
    std::vector<std::string> predecessors;
    std::vector<std::string> successors;

    const Node * out_node = graph.get_node(pair.out_node_id);
    const Node * in_node = graph.get_node(pair.in_node_id);

    for (const auto idx : out_node->incoming) {
      const Node * src = graph.get_node(graph.edges_[idx].source_id);
      if (src && src->is_task_like()) predecessors.push_back(src->id);
    }
    for (const auto idx : in_node->outgoing) {
      const Node * tgt = graph.get_node(graph.edges_[idx].target_id);
      if (tgt && tgt->is_task_like()) successors.push_back(tgt->id);
    }

    for (const auto & src : predecessors) {
      for (const auto & tgt : successors) {
        add_bridge(graph, bridged, fmt::format("__link_{}_{}_{}__", pair.name, src, tgt), src, tgt);
      }
    }
  }
}

void GraphBuilder::bridge_user_inputs(WorkflowGraph & graph, BridgeSet & bridged)
{
  std::vector<std::string> pauses;
  for (const auto & node : graph.nodes_) {
    if (node.kind == NodeKind::UserInput) pauses.push_back(node.id);
  }

  for (const auto & id : pauses) {
    std::vector<std::string> predecessors;
    std::vector<std::string> successors;

    const Node * pause = graph.get_node(id);
    for (const Edge * e : graph.incoming(*pause, SemanticTag::Sequential)) {
      const Node * src = graph.get_node(e->source_id);
      if (src && src->is_task_like()) predecessors.push_back(src->id);
    }
    for (const Node * tgt : graph.sequential_successors(*pause)) {
      if (tgt->is_task_like()) successors.push_back(tgt->id);
    }

    for (const auto & src : predecessors) {
      for (const auto & tgt : successors) {
        add_bridge(graph, bridged, fmt::format("__input_{}_{}_{}__", id, src, tgt), src, tgt);
      }
    }
  }
}

void GraphBuilder::add_bridge(
  WorkflowGraph & graph, BridgeSet & bridged, std::string id, const std::string & source,
  const std::string & target)
{
  if (!bridged.emplace(source, target).second) {
    return;
  }
  Edge edge;
  edge.id = std::move(id);
  edge.source_id = source;
  edge.target_id = target;
  edge.semantics = EdgeSemantics::of(SemanticTag::Sequential);
  append_edge(graph, std::move(edge));
}

void GraphBuilder::compute_entry_nodes(WorkflowGraph & graph)
{
  for (const auto & node : graph.nodes_) {
    if (!node.is_task_like()) {
      continue;
    }
    // Start and user-input nodes only mark where the flow begins; ordering
    // through a paused user input is carried by its bridge edges.
    bool ordered = false;
    for (const Edge * e : graph.incoming(node, SemanticTag::Sequential)) {
      const Node * src = graph.get_node(e->source_id);
      if (src == nullptr || !is_flow_marker(src->kind)) {
        ordered = true;
        break;
      }
    }
    if (!ordered) {
      graph.entry_nodes_.push_back(node.id);
    }
  }
}

EdgeIndex GraphBuilder::append_edge(WorkflowGraph & graph, Edge edge)
{
  const EdgeIndex idx = graph.edges_.size();
  const size_t src = graph.index_.at(edge.source_id);
  const size_t tgt = graph.index_.at(edge.target_id);
  graph.edges_.push_back(std::move(edge));
  graph.nodes_[src].outgoing.push_back(idx);
  graph.nodes_[tgt].incoming.push_back(idx);
  return idx;
}

}  // namespace flowplan
