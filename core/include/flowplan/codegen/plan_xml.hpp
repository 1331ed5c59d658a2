// flowplan/codegen/plan_xml.hpp - Emit a synthesized plan as BehaviorTree-style XML
#pragma once

#include <string>

#include "flowplan/codegen/plan_model.hpp"
#include "flowplan/graph/workflow_graph.hpp"
#include "flowplan/plan/hierarchy.hpp"

namespace flowplan
{

/**
 * Converts a hierarchy into the intermediate XML model.
 *
 * Keeping this step separate from serialization keeps tinyxml2 out of the
 * rest of the codebase.
 */
class PlanModelConverter
{
public:
  PlanModelConverter() = default;

  /**
   * Convert a plan to the XML model.
   * @param plan Synthesized hierarchy
   * @param tree_id ID of the single BehaviorTree element
   * @param graph Source graph; when given, leaves carry the task's kind and
   *        composite sub-kind
   */
  [[nodiscard]] static xml::Document convert(
    const HierarchyNode & plan, const std::string & tree_id,
    const WorkflowGraph * graph = nullptr);

private:
  [[nodiscard]] static xml::Element convert_node(
    const HierarchyNode & node, const WorkflowGraph * graph);
};

/**
 * Serialize an XML model to a UTF-8 string using tinyxml2.
 */
class PlanXmlSerializer
{
public:
  PlanXmlSerializer() = default;

  [[nodiscard]] static std::string serialize(const xml::Document & doc);
};

/**
 * High-level facade: hierarchy -> model -> XML string.
 */
class PlanXmlGenerator
{
public:
  PlanXmlGenerator() = default;

  [[nodiscard]] static std::string generate(
    const HierarchyNode & plan, const std::string & tree_id,
    const WorkflowGraph * graph = nullptr);
};

}  // namespace flowplan
