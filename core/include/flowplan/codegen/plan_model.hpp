// flowplan/codegen/plan_model.hpp - Intermediate XML structure (hierarchy -> model -> XML)
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace flowplan::xml
{

// NOTE:
// Serialization-friendly model of the BehaviorTree-style plan document.
// It avoids tinyxml2 types so the conversion can be tested on its own.

struct Attribute
{
  std::string key;
  std::string value;
};

struct Element
{
  std::string tag;                    // "Sequence", "Parallel", "Task"
  std::vector<Attribute> attributes;  // XML attributes, in output order
  std::vector<Element> children;

  [[nodiscard]] const std::string * attribute(const std::string & key) const
  {
    for (const auto & a : attributes) {
      if (a.key == key) return &a.value;
    }
    return nullptr;
  }
};

struct PlanTree
{
  std::string id;
  std::optional<std::string> description;  // -> <Metadata><item key="description" .../></Metadata>
  std::optional<Element> root;
};

struct Document
{
  std::string main_tree_to_execute;
  std::vector<PlanTree> trees;
};

}  // namespace flowplan::xml
