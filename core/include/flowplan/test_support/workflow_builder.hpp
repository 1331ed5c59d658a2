// flowplan/test_support/workflow_builder.hpp - helpers for unit/integration tests
//
// Fluent construction of WorkflowInput fixtures. Nodes and edges go into the
// most recently opened region; a "main" region is opened on first use.
//
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

#include "flowplan/graph/graph_builder.hpp"
#include "flowplan/graph/workflow_graph.hpp"
#include "flowplan/graph/workflow_input.hpp"

namespace flowplan::test_support
{

class WorkflowBuilder
{
public:
  explicit WorkflowBuilder(std::string name = "test") { input_.name = std::move(name); }

  WorkflowBuilder & region(std::string id, std::string name = {})
  {
    Region r;
    r.name = name.empty() ? id : std::move(name);
    r.id = std::move(id);
    input_.regions.push_back(std::move(r));
    return *this;
  }

  WorkflowBuilder & node(
    std::string id, std::string type, std::string name = {},
    nlohmann::json config = nlohmann::json::object())
  {
    RawNode n;
    n.name = name.empty() ? id : std::move(name);
    n.id = std::move(id);
    n.type = std::move(type);
    n.config = std::move(config);
    current().nodes.push_back(std::move(n));
    return *this;
  }

  /// LLM agent task
  WorkflowBuilder & task(std::string id, std::string name = {})
  {
    return node(std::move(id), "agent", std::move(name));
  }

  WorkflowBuilder & task_with(std::string id, nlohmann::json config)
  {
    return node(std::move(id), "agent", {}, std::move(config));
  }

  WorkflowBuilder & composite(std::string id, const std::string & kind, nlohmann::json config = {})
  {
    if (!config.is_object()) config = nlohmann::json::object();
    config["type"] = kind;
    return node(std::move(id), "agent", {}, std::move(config));
  }

  WorkflowBuilder & prompt(std::string id, const std::string & file_path)
  {
    return node(std::move(id), "prompt", {}, nlohmann::json{{"file_path", file_path}});
  }

  WorkflowBuilder & context(std::string id, const std::string & file_path)
  {
    return node(std::move(id), "context", {}, nlohmann::json{{"file_path", file_path}});
  }

  WorkflowBuilder & tool(std::string id, const std::string & file_path)
  {
    return node(std::move(id), "tool", {}, nlohmann::json{{"file_path", file_path}});
  }

  WorkflowBuilder & link_out(std::string id, const std::string & link_name)
  {
    return node(std::move(id), "teleportOut", {}, nlohmann::json{{"name", link_name}});
  }

  WorkflowBuilder & link_in(std::string id, const std::string & link_name)
  {
    return node(std::move(id), "teleportIn", {}, nlohmann::json{{"name", link_name}});
  }

  WorkflowBuilder & edge(
    std::string source, std::string target, std::optional<std::string> source_handle = {},
    std::optional<std::string> target_handle = {})
  {
    RawEdge e;
    e.id = "e" + std::to_string(++edge_counter_);
    e.source = std::move(source);
    e.target = std::move(target);
    e.source_handle = std::move(source_handle);
    e.target_handle = std::move(target_handle);
    current().edges.push_back(std::move(e));
    return *this;
  }

  /// Task output -> task input (SEQUENTIAL)
  WorkflowBuilder & then(std::string source, std::string target)
  {
    return edge(std::move(source), std::move(target), "output", "input");
  }

  /// Task link-top -> task link-bottom (PARALLEL)
  WorkflowBuilder & alongside(std::string source, std::string target)
  {
    return edge(std::move(source), std::move(target), "link-top", "link-bottom");
  }

  /// Data provider -> task (INPUT_DATA)
  WorkflowBuilder & feeds(std::string source, std::string target)
  {
    return edge(std::move(source), std::move(target));
  }

  WorkflowBuilder & content(std::string path, std::string text)
  {
    content_.emplace(std::move(path), std::move(text));
    return *this;
  }

  [[nodiscard]] const WorkflowInput & input() const noexcept { return input_; }
  [[nodiscard]] const ContentTable & content_table() const noexcept { return content_; }

  /// Build the graph with the default rule table.
  [[nodiscard]] WorkflowGraph graph() const { return GraphBuilder().build(input_); }

private:
  Region & current()
  {
    if (input_.regions.empty()) region("main", "Main");
    return input_.regions.back();
  }

  WorkflowInput input_;
  ContentTable content_;
  int edge_counter_ = 0;
};

}  // namespace flowplan::test_support
