// flowplan/plan/hierarchy.hpp - Strict single-parent execution tree
//
// The execution runtime only understands tree composition: a Sequence runs
// its children in order, a Parallel runs them concurrently, a Leaf is one
// task. This is the compiler's output model; emitters serialize it.
//
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flowplan
{

enum class HierarchyKind : uint8_t {
  Leaf,
  Sequence,
  Parallel,
};

[[nodiscard]] const char * to_string(HierarchyKind kind) noexcept;

struct HierarchyNode
{
  HierarchyKind kind = HierarchyKind::Leaf;

  /// Source task id for leaves; generated wrapper id for Sequence/Parallel.
  std::string id;

  /// Display name of the task (leaves only).
  std::string name;

  std::vector<HierarchyNode> children;

  static HierarchyNode leaf(std::string task_id, std::string task_name = {});
  static HierarchyNode sequence(std::string id, std::vector<HierarchyNode> children);
  static HierarchyNode parallel(std::string id, std::vector<HierarchyNode> children);

  [[nodiscard]] bool is_leaf() const noexcept { return kind == HierarchyKind::Leaf; }

  /// Source task ids in depth-first order.
  [[nodiscard]] std::vector<std::string> leaf_ids() const;

  /// Number of nodes in this subtree, wrappers included.
  [[nodiscard]] size_t size() const noexcept;

  /// Maximum nesting depth (a lone leaf has depth 1).
  [[nodiscard]] size_t depth() const noexcept;

  /// Structural equality, ignoring generated wrapper ids.
  [[nodiscard]] bool same_shape(const HierarchyNode & other) const noexcept;

  /// Compact form, e.g. "Sequence[A, Parallel[B, C]]".
  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] bool operator==(const HierarchyNode & a, const HierarchyNode & b) noexcept;
[[nodiscard]] inline bool operator!=(const HierarchyNode & a, const HierarchyNode & b) noexcept
{
  return !(a == b);
}

}  // namespace flowplan
