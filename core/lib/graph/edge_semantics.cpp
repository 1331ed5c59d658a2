// flowplan/graph/edge_semantics.cpp - Edge rule table implementation
#include "flowplan/graph/edge_semantics.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace flowplan
{

const char * to_string(SemanticTag tag) noexcept
{
  switch (tag) {
    case SemanticTag::Sequential:
      return "sequential";
    case SemanticTag::Parallel:
      return "parallel";
    case SemanticTag::Subtask:
      return "subtask";
    case SemanticTag::InputData:
      return "input_data";
    case SemanticTag::OutputSink:
      return "output_sink";
    case SemanticTag::CrossRegionLink:
      return "cross_region_link";
    case SemanticTag::Unknown:
      return "unknown";
  }
  return "unknown";
}

const char * to_string(InputKind kind) noexcept
{
  switch (kind) {
    case InputKind::None:
      return "none";
    case InputKind::Instruction:
      return "instruction";
    case InputKind::Tool:
      return "tool";
    case InputKind::Context:
      return "context";
  }
  return "none";
}

std::string to_string(EdgeSemantics semantics)
{
  std::string out = to_string(semantics.tag);
  if (semantics.tag == SemanticTag::InputData && semantics.input != InputKind::None) {
    out += ":";
    out += to_string(semantics.input);
  }
  return out;
}

std::optional<EdgeSemantics> parse_edge_semantics(std::string_view text)
{
  constexpr std::array<SemanticTag, 7> k_tags = {
    SemanticTag::Sequential, SemanticTag::Parallel,        SemanticTag::Subtask,
    SemanticTag::InputData,  SemanticTag::OutputSink,      SemanticTag::CrossRegionLink,
    SemanticTag::Unknown,
  };
  constexpr std::array<InputKind, 3> k_inputs = {
    InputKind::Instruction, InputKind::Tool, InputKind::Context};

  std::string_view head = text;
  std::string_view tail;
  if (const auto colon = text.find(':'); colon != std::string_view::npos) {
    head = text.substr(0, colon);
    tail = text.substr(colon + 1);
  }

  for (const auto tag : k_tags) {
    if (head != to_string(tag)) {
      continue;
    }
    if (tail.empty()) {
      return EdgeSemantics::of(tag);
    }
    if (tag != SemanticTag::InputData) {
      return std::nullopt;
    }
    for (const auto k : k_inputs) {
      if (tail == to_string(k)) {
        return EdgeSemantics::input_data(k);
      }
    }
    return std::nullopt;
  }
  return std::nullopt;
}

// ============================================================================
// EdgeRule
// ============================================================================

bool EdgeRule::matches(
  NodeKind source, NodeKind target, const std::optional<std::string> & src_handle,
  const std::optional<std::string> & tgt_handle) const
{
  if (source_kind != source || target_kind != target) {
    return false;
  }
  if (source_handle && source_handle != src_handle) {
    return false;
  }
  if (target_handle && target_handle != tgt_handle) {
    return false;
  }
  return true;
}

// ============================================================================
// EdgeRuleTable
// ============================================================================

namespace
{

EdgeRule rule(
  NodeKind src, NodeKind tgt, EdgeSemantics semantics, int priority = 10,
  std::optional<std::string> src_handle = std::nullopt,
  std::optional<std::string> tgt_handle = std::nullopt)
{
  EdgeRule r;
  r.source_kind = src;
  r.target_kind = tgt;
  r.source_handle = std::move(src_handle);
  r.target_handle = std::move(tgt_handle);
  r.semantics = semantics;
  r.priority = priority;
  return r;
}

constexpr std::array<NodeKind, 2> k_task_like = {NodeKind::Task, NodeKind::Composite};

}  // namespace

EdgeRuleTable EdgeRuleTable::defaults()
{
  using S = SemanticTag;
  EdgeRuleTable table;

  // Task <-> task relationships, selected by handle.
  for (const auto src : k_task_like) {
    for (const auto tgt : k_task_like) {
      table.add_rule(rule(src, tgt, EdgeSemantics::of(S::Sequential), 10, "output", "input"));
      table.add_rule(
        rule(src, tgt, EdgeSemantics::of(S::Parallel), 10, "link-top", "link-bottom"));
      table.add_rule(
        rule(src, tgt, EdgeSemantics::of(S::Parallel), 10, "link-bottom", "link-top"));
      table.add_rule(rule(src, tgt, EdgeSemantics::of(S::Subtask), 10, "plug", "sub-agents"));
    }
  }

  for (const auto task : k_task_like) {
    // Data flowing into a task
    table.add_rule(
      rule(NodeKind::Prompt, task, EdgeSemantics::input_data(InputKind::Instruction)));
    table.add_rule(rule(NodeKind::Context, task, EdgeSemantics::input_data(InputKind::Context)));
    table.add_rule(rule(NodeKind::Tool, task, EdgeSemantics::input_data(InputKind::Tool)));
    table.add_rule(
      rule(NodeKind::Variable, task, EdgeSemantics::input_data(InputKind::Context), 5));

    // Output handling
    table.add_rule(rule(task, NodeKind::OutputSink, EdgeSemantics::of(S::OutputSink)));

    // Link plumbing
    table.add_rule(rule(task, NodeKind::LinkOut, EdgeSemantics::of(S::CrossRegionLink)));
    table.add_rule(rule(NodeKind::LinkIn, task, EdgeSemantics::of(S::CrossRegionLink)));

    // Entry, termination and pause points
    table.add_rule(rule(NodeKind::Start, task, EdgeSemantics::of(S::Sequential)));
    table.add_rule(rule(task, NodeKind::End, EdgeSemantics::of(S::Sequential)));
    table.add_rule(
      rule(task, NodeKind::UserInput, EdgeSemantics::of(S::Sequential), 10, "output", "input"));
    table.add_rule(
      rule(NodeKind::UserInput, task, EdgeSemantics::of(S::Sequential), 10, "output", "input"));
  }

  table.add_rule(rule(NodeKind::LinkOut, NodeKind::LinkIn, EdgeSemantics::of(S::CrossRegionLink)));

  return table;
}

EdgeSemantics EdgeRuleTable::resolve(
  NodeKind source, NodeKind target, const std::optional<std::string> & source_handle,
  const std::optional<std::string> & target_handle) const
{
  for (const auto & r : rules_) {
    if (r.matches(source, target, source_handle, target_handle)) {
      return r.semantics;
    }
  }
  return EdgeSemantics::of(SemanticTag::Unknown);
}

void EdgeRuleTable::add_rule(EdgeRule rule)
{
  // Insert after every rule with priority >= the new one.
  const auto pos = std::upper_bound(
    rules_.begin(), rules_.end(), rule.priority,
    [](int priority, const EdgeRule & existing) { return priority > existing.priority; });
  rules_.insert(pos, std::move(rule));
}

size_t EdgeRuleTable::remove_rules_for(NodeKind source, NodeKind target)
{
  const auto before = rules_.size();
  rules_.erase(
    std::remove_if(
      rules_.begin(), rules_.end(),
      [&](const EdgeRule & r) { return r.source_kind == source && r.target_kind == target; }),
    rules_.end());
  return before - rules_.size();
}

}  // namespace flowplan
