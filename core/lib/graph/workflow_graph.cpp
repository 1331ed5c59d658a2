// flowplan/graph/workflow_graph.cpp - WorkflowGraph queries
#include "flowplan/graph/workflow_graph.hpp"

#include <unordered_set>

namespace flowplan
{

std::string Node::config_string(const char * key, std::string fallback) const
{
  if (!config.is_object()) {
    return fallback;
  }
  const auto it = config.find(key);
  if (it == config.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

const Node * WorkflowGraph::get_node(const std::string & id) const
{
  const auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &nodes_[it->second];
}

std::vector<const Node *> WorkflowGraph::task_nodes() const
{
  std::vector<const Node *> out;
  for (const auto & n : nodes_) {
    if (n.is_task_like()) out.push_back(&n);
  }
  return out;
}

std::vector<const Node *> WorkflowGraph::nodes_of_kind(NodeKind kind) const
{
  std::vector<const Node *> out;
  for (const auto & n : nodes_) {
    if (n.kind == kind) out.push_back(&n);
  }
  return out;
}

std::vector<const Edge *> WorkflowGraph::incoming(const Node & node, SemanticTag tag) const
{
  std::vector<const Edge *> out;
  for (const auto idx : node.incoming) {
    const Edge & e = edges_[idx];
    if (e.is(tag)) out.push_back(&e);
  }
  return out;
}

std::vector<const Edge *> WorkflowGraph::outgoing(const Node & node, SemanticTag tag) const
{
  std::vector<const Edge *> out;
  for (const auto idx : node.outgoing) {
    const Edge & e = edges_[idx];
    if (e.is(tag)) out.push_back(&e);
  }
  return out;
}

std::vector<const Node *> WorkflowGraph::sequential_successors(const Node & node) const
{
  std::vector<const Node *> out;
  std::unordered_set<std::string> seen;
  for (const auto idx : node.outgoing) {
    const Edge & e = edges_[idx];
    if (!e.is(SemanticTag::Sequential)) continue;
    const Node * target = get_node(e.target_id);
    if (target && seen.insert(target->id).second) {
      out.push_back(target);
    }
  }
  return out;
}

Location WorkflowGraph::location_of(const Node & node) const
{
  Location loc;
  loc.node_id = node.id;
  loc.node_name = node.name;
  loc.region_id = node.region_id;
  loc.region_name = region_name(node.region_id);
  return loc;
}

const std::string & WorkflowGraph::region_name(const std::string & region_id) const
{
  static const std::string k_empty;
  const auto it = region_names_.find(region_id);
  return it == region_names_.end() ? k_empty : it->second;
}

}  // namespace flowplan
