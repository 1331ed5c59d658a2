// flowplan/graph/workflow_graph.hpp - Typed workflow graph with resolved edges
//
// Built once per compilation by GraphBuilder and treated as immutable by every
// consumer afterwards (validator, synthesizer, emitters).
//
#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "flowplan/basic/location.hpp"
#include "flowplan/graph/edge_semantics.hpp"
#include "flowplan/graph/node_kind.hpp"
#include "flowplan/graph/workflow_input.hpp"

namespace flowplan
{

using EdgeIndex = size_t;

struct Edge
{
  std::string id;
  std::string source_id;
  std::string target_id;
  std::optional<std::string> source_handle;
  std::optional<std::string> target_handle;
  EdgeSemantics semantics;

  /// The authored edge this one came from; empty for synthesized bridges.
  std::optional<RawEdge> origin;

  [[nodiscard]] bool is_virtual() const noexcept { return !origin.has_value(); }
  [[nodiscard]] bool is(SemanticTag tag) const noexcept { return semantics.tag == tag; }
};

struct Node
{
  std::string id;
  NodeKind kind = NodeKind::Custom;
  CompositeKind composite = CompositeKind::None;
  std::string raw_type;
  std::string name;
  std::string region_id;
  nlohmann::json config = nlohmann::json::object();

  std::vector<EdgeIndex> incoming;
  std::vector<EdgeIndex> outgoing;

  [[nodiscard]] bool is_task_like() const noexcept { return flowplan::is_task_like(kind); }

  /// String config value, or `fallback` when absent or not a string.
  [[nodiscard]] std::string config_string(const char * key, std::string fallback = {}) const;
};

/**
 * A matched pair of link nodes sharing a name.
 */
struct LinkPair
{
  std::string name;
  std::string out_node_id;
  std::string in_node_id;
};

class WorkflowGraph
{
public:
  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] const Node * get_node(const std::string & id) const;
  [[nodiscard]] bool contains(const std::string & id) const { return index_.count(id) > 0; }

  /// All nodes in insertion order.
  [[nodiscard]] const std::vector<Node> & nodes() const noexcept { return nodes_; }
  [[nodiscard]] const std::vector<Edge> & edges() const noexcept { return edges_; }
  [[nodiscard]] const Edge & edge(EdgeIndex index) const { return edges_.at(index); }
  [[nodiscard]] const std::vector<LinkPair> & link_pairs() const noexcept { return link_pairs_; }

  /// Task-like nodes with no incoming SEQUENTIAL edge, in insertion order.
  /// Edges from start and user-input nodes do not count.
  [[nodiscard]] const std::vector<std::string> & entry_nodes() const noexcept
  {
    return entry_nodes_;
  }

  [[nodiscard]] std::vector<const Node *> task_nodes() const;
  [[nodiscard]] std::vector<const Node *> nodes_of_kind(NodeKind kind) const;

  // ===========================================================================
  // Edge queries
  // ===========================================================================

  [[nodiscard]] std::vector<const Edge *> incoming(const Node & node, SemanticTag tag) const;
  [[nodiscard]] std::vector<const Edge *> outgoing(const Node & node, SemanticTag tag) const;

  /// Targets of outgoing SEQUENTIAL edges, de-duplicated, in edge order.
  [[nodiscard]] std::vector<const Node *> sequential_successors(const Node & node) const;

  /// Location of a node, including region display name.
  [[nodiscard]] Location location_of(const Node & node) const;

  [[nodiscard]] const std::string & region_name(const std::string & region_id) const;

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

private:
  friend class GraphBuilder;

  std::vector<Node> nodes_;
  std::unordered_map<std::string, size_t> index_;
  std::vector<Edge> edges_;
  std::vector<LinkPair> link_pairs_;
  std::vector<std::string> entry_nodes_;
  std::unordered_map<std::string, std::string> region_names_;
};

}  // namespace flowplan
