// flowplan/graph/edge_semantics.hpp - Edge meaning resolved from endpoint kinds and handles
//
// The same pair of node kinds can mean different things depending on the
// handles the author connected (task output->input is SEQUENTIAL, task
// link-top->link-bottom is PARALLEL). The mapping is a prioritized rule table
// rather than branching code so that projects can extend it from config.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flowplan/graph/node_kind.hpp"

namespace flowplan
{

// ============================================================================
// Semantic Tag
// ============================================================================

enum class SemanticTag : uint8_t {
  Sequential,       // source runs before target
  Parallel,         // source and target run concurrently
  Subtask,          // source is a sub-task of target
  InputData,        // source feeds data into target (see InputKind)
  OutputSink,       // target consumes source's output
  CrossRegionLink,  // plumbing of a named cross-region link
  Unknown,
};

/// Sub-kind of an INPUT_DATA edge.
enum class InputKind : uint8_t {
  None,
  Instruction,
  Tool,
  Context,
};

/**
 * Resolved meaning of an edge.
 */
struct EdgeSemantics
{
  SemanticTag tag = SemanticTag::Unknown;
  InputKind input = InputKind::None;

  static constexpr EdgeSemantics of(SemanticTag t) noexcept { return {t, InputKind::None}; }
  static constexpr EdgeSemantics input_data(InputKind k) noexcept
  {
    return {SemanticTag::InputData, k};
  }

  [[nodiscard]] constexpr bool is(SemanticTag t) const noexcept { return tag == t; }

  /// Instruction, tool or context data flowing into a task
  [[nodiscard]] constexpr bool is_data_flow() const noexcept
  {
    return tag == SemanticTag::InputData;
  }

  /// Ordering or grouping relationship between tasks
  [[nodiscard]] constexpr bool is_task_flow() const noexcept
  {
    return tag == SemanticTag::Sequential || tag == SemanticTag::Parallel ||
           tag == SemanticTag::Subtask;
  }

  [[nodiscard]] constexpr bool operator==(EdgeSemantics other) const noexcept
  {
    return tag == other.tag && input == other.input;
  }
  [[nodiscard]] constexpr bool operator!=(EdgeSemantics other) const noexcept
  {
    return !(*this == other);
  }
};

[[nodiscard]] const char * to_string(SemanticTag tag) noexcept;
[[nodiscard]] const char * to_string(InputKind kind) noexcept;

/// "sequential", "input_data:instruction", ...
[[nodiscard]] std::string to_string(EdgeSemantics semantics);

/// Parse the canonical form produced by to_string(EdgeSemantics).
[[nodiscard]] std::optional<EdgeSemantics> parse_edge_semantics(std::string_view text);

// ============================================================================
// Rule Table
// ============================================================================

/**
 * A single edge interpretation rule.
 *
 * Kinds must match exactly; an unset handle matches any handle (including no
 * handle at all).
 */
struct EdgeRule
{
  NodeKind source_kind = NodeKind::Custom;
  NodeKind target_kind = NodeKind::Custom;
  std::optional<std::string> source_handle;
  std::optional<std::string> target_handle;
  EdgeSemantics semantics;
  int priority = 0;

  [[nodiscard]] bool matches(
    NodeKind source, NodeKind target, const std::optional<std::string> & src_handle,
    const std::optional<std::string> & tgt_handle) const;
};

/**
 * Ordered, prioritized edge rule table.
 *
 * Rules are evaluated in descending priority; rules of equal priority keep
 * the order in which they were added. The first match wins.
 */
class EdgeRuleTable
{
public:
  EdgeRuleTable() = default;

  /// The built-in rule set for canvas workflows.
  [[nodiscard]] static EdgeRuleTable defaults();

  /**
   * Resolve the semantics of an edge.
   *
   * @return The first matching rule's semantics, or UNKNOWN if none matches
   */
  [[nodiscard]] EdgeSemantics resolve(
    NodeKind source, NodeKind target, const std::optional<std::string> & source_handle = {},
    const std::optional<std::string> & target_handle = {}) const;

  void add_rule(EdgeRule rule);

  /// Remove every rule for the given kind pair. Returns the number removed.
  size_t remove_rules_for(NodeKind source, NodeKind target);

  [[nodiscard]] const std::vector<EdgeRule> & rules() const noexcept { return rules_; }
  [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

private:
  // Kept sorted by descending priority (stable w.r.t. insertion).
  std::vector<EdgeRule> rules_;
};

}  // namespace flowplan
