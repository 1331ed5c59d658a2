// flowplan/plan/hierarchy_synthesizer.cpp - Fork/join reconstruction
#include "flowplan/plan/hierarchy_synthesizer.hpp"

#include <deque>
#include <stdexcept>
#include <utility>

namespace flowplan
{

namespace
{

bool contains(const std::unordered_set<std::string> & set, const std::string & id)
{
  return set.count(id) > 0;
}

}  // namespace

std::optional<HierarchyNode> HierarchySynthesizer::synthesize(
  const std::vector<std::string> & roots)
{
  if (state_.used) {
    throw std::logic_error("HierarchySynthesizer::synthesize called twice on the same instance");
  }
  state_.used = true;
  return build(roots, nullptr);
}

// ============================================================================
// Dispatch
// ============================================================================

std::optional<HierarchyNode> HierarchySynthesizer::build(
  const std::vector<std::string> & roots, const Boundary * bound)
{
  std::vector<std::string> open;
  NodeSet seen;
  for (const auto & id : roots) {
    const Node * node = graph_.get_node(id);
    if (node == nullptr || !node->is_task_like()) {
      continue;
    }
    if (bound != nullptr && contains(bound->closed, id)) {
      continue;
    }
    if (state_.visited.count(id) > 0 || !seen.insert(id).second) {
      continue;
    }
    open.push_back(id);
  }

  if (open.empty()) {
    return std::nullopt;
  }
  if (open.size() == 1) {
    return build_chain(open.front(), bound);
  }

  if (auto merge = find_merge_point(open, bound)) {
    return build_fork_join(open, *merge, bound);
  }
  return build_fan_out(open, bound);
}

// ============================================================================
// Chains
// ============================================================================

std::optional<HierarchyNode> HierarchySynthesizer::build_chain(
  const std::string & start, const Boundary * bound)
{
  if (contains(state_.visited, start) || (bound != nullptr && contains(bound->closed, start))) {
    return std::nullopt;
  }

  std::vector<HierarchyNode> chain;
  std::string current = start;

  while (true) {
    state_.visited.insert(current);
    const Node * node = graph_.get_node(current);
    chain.push_back(HierarchyNode::leaf(current, node != nullptr ? node->name : std::string{}));

    std::vector<std::string> next = open_successors(current, bound);
    if (next.empty()) {
      break;
    }
    if (next.size() == 1) {
      current = next.front();
      continue;
    }

    // Fork: the branches (and their join, if any) complete the chain.
    if (auto forked = build(next, bound)) {
      chain.push_back(std::move(*forked));
    }
    break;
  }

  if (chain.size() == 1) {
    return std::move(chain.front());
  }
  return make_sequence(std::move(chain));
}

// ============================================================================
// Forks
// ============================================================================

std::optional<HierarchyNode> HierarchySynthesizer::build_fork_join(
  const std::vector<std::string> & roots, const std::string & merge, const Boundary * bound)
{
  const Boundary inner = boundary_at(merge, bound);

  std::vector<HierarchyNode> branches;
  for (const auto & root : roots) {
    if (auto branch = build_chain(root, &inner)) {
      branches.push_back(std::move(*branch));
    }
  }

  std::optional<HierarchyNode> fork;
  if (branches.size() == 1) {
    fork = std::move(branches.front());
  } else if (!branches.empty()) {
    fork = make_parallel(std::move(branches));
  }

  std::optional<HierarchyNode> continuation = build({merge}, bound);

  if (fork && continuation) {
    std::vector<HierarchyNode> parts;
    parts.push_back(std::move(*fork));
    parts.push_back(std::move(*continuation));
    return make_sequence(std::move(parts));
  }
  if (fork) {
    return fork;
  }
  return continuation;
}

std::optional<HierarchyNode> HierarchySynthesizer::build_fan_out(
  const std::vector<std::string> & roots, const Boundary * bound)
{
  std::vector<HierarchyNode> branches;
  for (const auto & root : roots) {
    if (auto branch = build_chain(root, bound)) {
      branches.push_back(std::move(*branch));
    }
  }

  if (branches.empty()) {
    return std::nullopt;
  }
  if (branches.size() == 1) {
    return std::move(branches.front());
  }
  return make_parallel(std::move(branches));
}

// ============================================================================
// Merge point search
// ============================================================================

std::optional<std::string> HierarchySynthesizer::find_merge_point(
  const std::vector<std::string> & roots, const Boundary * bound) const
{
  NodeSet common;
  bool first = true;
  for (const auto & root : roots) {
    NodeSet reach = reachable_from(root, bound);
    if (first) {
      common = std::move(reach);
      first = false;
      continue;
    }
    for (auto it = common.begin(); it != common.end();) {
      if (reach.count(*it) == 0) {
        it = common.erase(it);
      } else {
        ++it;
      }
    }
    if (common.empty()) {
      return std::nullopt;
    }
  }

  for (const auto & root : roots) {
    common.erase(root);
  }
  if (common.empty()) {
    return std::nullopt;
  }

  // Breadth-first from each root in turn; the first common node found wins.
  for (const auto & root : roots) {
    std::deque<std::string> queue{root};
    NodeSet seen{root};
    while (!queue.empty()) {
      std::string id = std::move(queue.front());
      queue.pop_front();
      for (auto & next : open_successors(id, bound)) {
        if (!seen.insert(next).second) {
          continue;
        }
        if (contains(common, next)) {
          return next;
        }
        queue.push_back(std::move(next));
      }
    }
  }
  return std::nullopt;
}

HierarchySynthesizer::NodeSet HierarchySynthesizer::reachable_from(
  const std::string & root, const Boundary * bound) const
{
  NodeSet reach;
  std::deque<std::string> queue{root};
  while (!queue.empty()) {
    std::string id = std::move(queue.front());
    queue.pop_front();
    for (auto & next : open_successors(id, bound)) {
      if (next == root || !reach.insert(next).second) {
        continue;
      }
      queue.push_back(std::move(next));
    }
  }
  return reach;
}

HierarchySynthesizer::Boundary HierarchySynthesizer::boundary_at(
  const std::string & merge, const Boundary * outer) const
{
  Boundary bound;
  if (outer != nullptr) {
    bound.closed = outer->closed;
  }

  // Graph structure only: placement state does not move the boundary.
  std::deque<std::string> queue{merge};
  bound.closed.insert(merge);
  while (!queue.empty()) {
    const Node * node = graph_.get_node(queue.front());
    queue.pop_front();
    if (node == nullptr) {
      continue;
    }
    for (const Node * succ : graph_.sequential_successors(*node)) {
      if (succ->is_task_like() && bound.closed.insert(succ->id).second) {
        queue.push_back(succ->id);
      }
    }
  }
  return bound;
}

std::vector<std::string> HierarchySynthesizer::open_successors(
  const std::string & id, const Boundary * bound) const
{
  std::vector<std::string> out;
  const Node * node = graph_.get_node(id);
  if (node == nullptr) {
    return out;
  }
  for (const Node * succ : graph_.sequential_successors(*node)) {
    if (!succ->is_task_like() || contains(state_.visited, succ->id)) {
      continue;
    }
    if (bound != nullptr && contains(bound->closed, succ->id)) {
      continue;
    }
    out.push_back(succ->id);
  }
  return out;
}

// ============================================================================
// Wrappers
// ============================================================================

HierarchyNode HierarchySynthesizer::make_sequence(std::vector<HierarchyNode> children)
{
  return HierarchyNode::sequence(next_id("seq"), std::move(children));
}

HierarchyNode HierarchySynthesizer::make_parallel(std::vector<HierarchyNode> children)
{
  return HierarchyNode::parallel(next_id("par"), std::move(children));
}

std::string HierarchySynthesizer::next_id(const char * prefix)
{
  std::string id;
  do {
    id = "__" + std::string(prefix) + "_" + std::to_string(state_.next_wrapper_id++) + "__";
  } while (graph_.contains(id));
  return id;
}

}  // namespace flowplan
