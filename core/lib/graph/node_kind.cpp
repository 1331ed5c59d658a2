// flowplan/graph/node_kind.cpp - Raw type string -> NodeKind mapping
#include "flowplan/graph/node_kind.hpp"

#include <array>

namespace flowplan
{

namespace
{

struct KindName
{
  std::string_view name;
  NodeKind kind;
};

// Raw canvas type names. Agents are handled separately because their kind
// depends on the configured behaviour.
constexpr std::array<KindName, 13> k_raw_types = {{
  {"sequentialGroup", NodeKind::Composite},
  {"parallelGroup", NodeKind::Composite},
  {"loop", NodeKind::Composite},
  {"prompt", NodeKind::Prompt},
  {"context", NodeKind::Context},
  {"tool", NodeKind::Tool},
  {"agentTool", NodeKind::Tool},
  {"variable", NodeKind::Variable},
  {"teleportOut", NodeKind::LinkOut},
  {"teleportIn", NodeKind::LinkIn},
  {"outputFile", NodeKind::OutputSink},
  {"userInput", NodeKind::UserInput},
  {"group", NodeKind::Group},
}};

constexpr std::array<KindName, 14> k_canonical = {{
  {"task", NodeKind::Task},
  {"composite", NodeKind::Composite},
  {"prompt", NodeKind::Prompt},
  {"context", NodeKind::Context},
  {"tool", NodeKind::Tool},
  {"variable", NodeKind::Variable},
  {"link_out", NodeKind::LinkOut},
  {"link_in", NodeKind::LinkIn},
  {"output_sink", NodeKind::OutputSink},
  {"start", NodeKind::Start},
  {"end", NodeKind::End},
  {"user_input", NodeKind::UserInput},
  {"group", NodeKind::Group},
  {"custom", NodeKind::Custom},
}};

std::string agent_behaviour(const nlohmann::json & config)
{
  if (!config.is_object()) {
    return "llm";
  }
  const auto it = config.find("type");
  if (it == config.end() || !it->is_string()) {
    return "llm";
  }
  return it->get<std::string>();
}

}  // namespace

NodeKind node_kind_from_string(std::string_view type, const nlohmann::json & config)
{
  if (type == "agent") {
    return composite_kind_from_string(type, config) == CompositeKind::None ? NodeKind::Task
                                                                           : NodeKind::Composite;
  }
  if (type == "start") return NodeKind::Start;
  if (type == "end") return NodeKind::End;

  for (const auto & entry : k_raw_types) {
    if (entry.name == type) {
      return entry.kind;
    }
  }
  return NodeKind::Custom;
}

CompositeKind composite_kind_from_string(std::string_view type, const nlohmann::json & config)
{
  if (type == "sequentialGroup") return CompositeKind::Sequential;
  if (type == "parallelGroup") return CompositeKind::Parallel;
  if (type == "loop") return CompositeKind::Loop;
  if (type != "agent") return CompositeKind::None;

  const std::string behaviour = agent_behaviour(config);
  if (behaviour == "sequential") return CompositeKind::Sequential;
  if (behaviour == "parallel") return CompositeKind::Parallel;
  if (behaviour == "loop") return CompositeKind::Loop;
  return CompositeKind::None;
}

std::optional<NodeKind> parse_node_kind(std::string_view name)
{
  for (const auto & entry : k_canonical) {
    if (entry.name == name) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

const char * to_string(NodeKind kind) noexcept
{
  for (const auto & entry : k_canonical) {
    if (entry.kind == kind) {
      return entry.name.data();
    }
  }
  return "custom";
}

const char * to_string(CompositeKind kind) noexcept
{
  switch (kind) {
    case CompositeKind::None:
      return "none";
    case CompositeKind::Sequential:
      return "sequential";
    case CompositeKind::Parallel:
      return "parallel";
    case CompositeKind::Loop:
      return "loop";
  }
  return "none";
}

}  // namespace flowplan
