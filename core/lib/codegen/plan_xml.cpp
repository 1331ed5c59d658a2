// flowplan/codegen/plan_xml.cpp - Hierarchy -> XML model -> tinyxml2
#include "flowplan/codegen/plan_xml.hpp"

#include <tinyxml2.h>

#include <string>
#include <utility>

namespace flowplan
{

// ============================================================================
// PlanModelConverter
// ============================================================================

xml::Document PlanModelConverter::convert(
  const HierarchyNode & plan, const std::string & tree_id, const WorkflowGraph * graph)
{
  xml::Document doc;
  doc.main_tree_to_execute = tree_id;

  xml::PlanTree tree;
  tree.id = tree_id;
  tree.root = convert_node(plan, graph);
  doc.trees.push_back(std::move(tree));
  return doc;
}

xml::Element PlanModelConverter::convert_node(
  const HierarchyNode & node, const WorkflowGraph * graph)
{
  xml::Element elem;

  switch (node.kind) {
    case HierarchyKind::Sequence:
      elem.tag = "Sequence";
      elem.attributes.push_back({"name", node.id});
      break;

    case HierarchyKind::Parallel:
      elem.tag = "Parallel";
      elem.attributes.push_back({"name", node.id});
      elem.attributes.push_back({"success_count", std::to_string(node.children.size())});
      break;

    case HierarchyKind::Leaf: {
      elem.tag = "Task";
      elem.attributes.push_back({"ID", node.id});
      elem.attributes.push_back({"name", node.name.empty() ? node.id : node.name});

      const Node * source = graph != nullptr ? graph->get_node(node.id) : nullptr;
      if (source != nullptr) {
        elem.attributes.push_back({"kind", to_string(source->kind)});
        if (source->composite != CompositeKind::None) {
          elem.attributes.push_back({"composite", to_string(source->composite)});
        }
      }
      return elem;
    }
  }

  for (const auto & child : node.children) {
    elem.children.push_back(convert_node(child, graph));
  }
  return elem;
}

// ============================================================================
// PlanXmlSerializer (tinyxml2)
// ============================================================================

namespace
{

tinyxml2::XMLElement * append_element(
  tinyxml2::XMLDocument & doc, tinyxml2::XMLElement * parent, const xml::Element & node)
{
  auto * elem = doc.NewElement(node.tag.c_str());

  for (const auto & a : node.attributes) {
    elem->SetAttribute(a.key.c_str(), a.value.c_str());
  }

  for (const auto & ch : node.children) {
    append_element(doc, elem, ch);
  }

  parent->InsertEndChild(elem);
  return elem;
}

}  // namespace

std::string PlanXmlSerializer::serialize(const xml::Document & doc_model)
{
  tinyxml2::XMLDocument doc;
  doc.InsertFirstChild(doc.NewDeclaration(R"(xml version="1.0" encoding="UTF-8")"));

  auto * root = doc.NewElement("root");
  root->SetAttribute("BTCPP_format", "4");
  root->SetAttribute("main_tree_to_execute", doc_model.main_tree_to_execute.c_str());
  doc.InsertEndChild(root);

  for (const auto & tree : doc_model.trees) {
    auto * bt = doc.NewElement("BehaviorTree");
    bt->SetAttribute("ID", tree.id.c_str());
    root->InsertEndChild(bt);

    if (tree.description.has_value()) {
      auto * meta = doc.NewElement("Metadata");
      auto * item = doc.NewElement("item");
      item->SetAttribute("key", "description");
      item->SetAttribute("value", tree.description->c_str());
      meta->InsertEndChild(item);
      bt->InsertEndChild(meta);
    }

    if (tree.root.has_value()) {
      append_element(doc, bt, *tree.root);
    }
  }

  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  return {printer.CStr()};
}

// ============================================================================
// PlanXmlGenerator facade
// ============================================================================

std::string PlanXmlGenerator::generate(
  const HierarchyNode & plan, const std::string & tree_id, const WorkflowGraph * graph)
{
  const auto model = PlanModelConverter::convert(plan, tree_id, graph);
  return PlanXmlSerializer::serialize(model);
}

}  // namespace flowplan
