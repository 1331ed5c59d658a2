// flowplan/graph/node_kind.hpp - Closed set of workflow node kinds
//
// Raw node types arrive as strings from the canvas. They are mapped once, at
// graph-build time, onto NodeKind so every later pass can switch over a closed
// enumeration.
//
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace flowplan
{

enum class NodeKind : uint8_t {
  Task,        // single executable unit (LLM agent, custom agent)
  Composite,   // sequential / parallel group or loop wrapping other tasks
  Prompt,      // instruction text provider
  Context,     // context text provider
  Tool,        // tool code provider
  Variable,    // named value provider
  LinkOut,     // outbound end of a cross-region link
  LinkIn,      // inbound end of a cross-region link
  OutputSink,  // writes task output somewhere
  Start,
  End,
  UserInput,
  Group,   // visual grouping only
  Custom,  // unrecognised type, kept but never executed
};

enum class CompositeKind : uint8_t {
  None,
  Sequential,
  Parallel,
  Loop,
};

/// Map a raw node type (and, for agents, their configured behaviour) to a kind.
[[nodiscard]] NodeKind node_kind_from_string(
  std::string_view type, const nlohmann::json & config = nlohmann::json::object());

/// Composite sub-kind for a raw node; CompositeKind::None for non-composites.
[[nodiscard]] CompositeKind composite_kind_from_string(
  std::string_view type, const nlohmann::json & config = nlohmann::json::object());

/// Parse a canonical kind name ("task", "prompt", ...). Used by config files.
[[nodiscard]] std::optional<NodeKind> parse_node_kind(std::string_view name);

[[nodiscard]] const char * to_string(NodeKind kind) noexcept;
[[nodiscard]] const char * to_string(CompositeKind kind) noexcept;

/// Task and Composite nodes are both placed in the execution hierarchy.
[[nodiscard]] constexpr bool is_task_like(NodeKind kind) noexcept
{
  return kind == NodeKind::Task || kind == NodeKind::Composite;
}

/// Nodes that only feed data into tasks.
[[nodiscard]] constexpr bool is_content_provider(NodeKind kind) noexcept
{
  return kind == NodeKind::Prompt || kind == NodeKind::Context || kind == NodeKind::Tool ||
         kind == NodeKind::Variable;
}

/// Content providers whose payload lives in an external file.
[[nodiscard]] constexpr bool references_external_content(NodeKind kind) noexcept
{
  return kind == NodeKind::Prompt || kind == NodeKind::Context || kind == NodeKind::Tool;
}

}  // namespace flowplan
