// flowplan/graph/topological_sort.cpp - Three-colour DFS over SEQUENTIAL edges

#include "flowplan/graph/topological_sort.hpp"

#include <cstdint>
#include <gsl/span>
#include <unordered_map>
#include <utility>

#include "flowplan/basic/errors.hpp"

namespace flowplan
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

struct Frame
{
  size_t node = 0;
  size_t next_edge = 0;  // position in the node's outgoing list
};

std::vector<std::string> cycle_path(
  const WorkflowGraph & graph, gsl::span<const Frame> stack, size_t back_target)
{
  std::vector<std::string> cycle;

  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start].node == back_target) {
      break;
    }
  }

  for (size_t i = start; i < stack.size(); ++i) {
    cycle.push_back(graph.nodes()[stack[i].node].id);
  }
  cycle.push_back(graph.nodes()[back_target].id);
  return cycle;
}

struct SortOutcome
{
  std::vector<std::string> order;
  std::optional<std::vector<std::string>> cycle;
};

SortOutcome run_dfs(const WorkflowGraph & graph)
{
  const auto & nodes = graph.nodes();

  std::unordered_map<std::string, size_t> position;
  position.reserve(nodes.size());
  for (size_t i = 0; i < nodes.size(); ++i) {
    position.emplace(nodes[i].id, i);
  }

  std::vector<Color> color(nodes.size(), Color::White);
  std::vector<std::string> finished;
  finished.reserve(nodes.size());

  std::vector<Frame> stack;
  stack.reserve(64);

  for (size_t root = 0; root < nodes.size(); ++root) {
    if (color[root] != Color::White) {
      continue;
    }

    color[root] = Color::Gray;
    stack.push_back(Frame{root, 0});

    while (!stack.empty()) {
      Frame & top = stack.back();
      const Node & u = nodes[top.node];

      if (top.next_edge >= u.outgoing.size()) {
        color[top.node] = Color::Black;
        finished.push_back(u.id);
        stack.pop_back();
        continue;
      }

      const Edge & e = graph.edge(u.outgoing[top.next_edge++]);
      if (!e.is(SemanticTag::Sequential)) {
        continue;
      }

      const size_t v = position.at(e.target_id);
      if (color[v] == Color::Gray) {
        SortOutcome out;
        out.cycle = cycle_path(graph, gsl::span<const Frame>(stack.data(), stack.size()), v);
        return out;
      }
      if (color[v] == Color::White) {
        color[v] = Color::Gray;
        stack.push_back(Frame{v, 0});
      }
    }
  }

  SortOutcome out;
  out.order.assign(finished.rbegin(), finished.rend());
  return out;
}

}  // namespace

std::vector<std::string> topological_sort(const WorkflowGraph & graph)
{
  SortOutcome outcome = run_dfs(graph);
  if (outcome.cycle) {
    throw CycleError(std::move(*outcome.cycle));
  }
  return std::move(outcome.order);
}

std::optional<std::vector<std::string>> find_sequential_cycle(const WorkflowGraph & graph)
{
  return run_dfs(graph).cycle;
}

}  // namespace flowplan
