// flowplan/plan/hierarchy.cpp - HierarchyNode helpers
#include "flowplan/plan/hierarchy.hpp"

#include <algorithm>
#include <utility>

namespace flowplan
{

const char * to_string(HierarchyKind kind) noexcept
{
  switch (kind) {
    case HierarchyKind::Leaf:
      return "Leaf";
    case HierarchyKind::Sequence:
      return "Sequence";
    case HierarchyKind::Parallel:
      return "Parallel";
  }
  return "Leaf";
}

HierarchyNode HierarchyNode::leaf(std::string task_id, std::string task_name)
{
  HierarchyNode n;
  n.kind = HierarchyKind::Leaf;
  n.id = std::move(task_id);
  n.name = std::move(task_name);
  return n;
}

HierarchyNode HierarchyNode::sequence(std::string id, std::vector<HierarchyNode> children)
{
  HierarchyNode n;
  n.kind = HierarchyKind::Sequence;
  n.id = std::move(id);
  n.children = std::move(children);
  return n;
}

HierarchyNode HierarchyNode::parallel(std::string id, std::vector<HierarchyNode> children)
{
  HierarchyNode n;
  n.kind = HierarchyKind::Parallel;
  n.id = std::move(id);
  n.children = std::move(children);
  return n;
}

namespace
{

void collect_leaves(const HierarchyNode & node, std::vector<std::string> & out)
{
  if (node.is_leaf()) {
    out.push_back(node.id);
    return;
  }
  for (const auto & child : node.children) {
    collect_leaves(child, out);
  }
}

}  // namespace

std::vector<std::string> HierarchyNode::leaf_ids() const
{
  std::vector<std::string> out;
  collect_leaves(*this, out);
  return out;
}

size_t HierarchyNode::size() const noexcept
{
  size_t n = 1;
  for (const auto & child : children) {
    n += child.size();
  }
  return n;
}

size_t HierarchyNode::depth() const noexcept
{
  size_t deepest = 0;
  for (const auto & child : children) {
    deepest = std::max(deepest, child.depth());
  }
  return deepest + 1;
}

bool HierarchyNode::same_shape(const HierarchyNode & other) const noexcept
{
  if (kind != other.kind || children.size() != other.children.size()) {
    return false;
  }
  if (is_leaf() && id != other.id) {
    return false;
  }
  for (size_t i = 0; i < children.size(); ++i) {
    if (!children[i].same_shape(other.children[i])) {
      return false;
    }
  }
  return true;
}

std::string HierarchyNode::to_string() const
{
  if (is_leaf()) {
    return id;
  }
  std::string out = flowplan::to_string(kind);
  out += "[";
  for (size_t i = 0; i < children.size(); ++i) {
    if (i > 0) out += ", ";
    out += children[i].to_string();
  }
  out += "]";
  return out;
}

bool operator==(const HierarchyNode & a, const HierarchyNode & b) noexcept
{
  return a.kind == b.kind && a.id == b.id && a.name == b.name && a.children == b.children;
}

}  // namespace flowplan
