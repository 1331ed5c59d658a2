// flowplan/codegen/ascii_tree.cpp - ASCII topology renderer
#include "flowplan/codegen/ascii_tree.hpp"

namespace flowplan
{

namespace
{

std::string label(const HierarchyNode & node)
{
  if (!node.is_leaf()) {
    return to_string(node.kind);
  }
  if (node.name.empty() || node.name == node.id) {
    return node.id;
  }
  return node.name + " (" + node.id + ")";
}

void render(const HierarchyNode & node, const std::string & prefix, bool is_last, std::string & out)
{
  out += prefix;
  out += is_last ? "└── " : "├── ";
  out += label(node);
  out += '\n';

  const std::string child_prefix = prefix + (is_last ? "    " : "│   ");
  for (size_t i = 0; i < node.children.size(); ++i) {
    render(node.children[i], child_prefix, i + 1 == node.children.size(), out);
  }
}

}  // namespace

std::string render_ascii_tree(const HierarchyNode & plan, const std::string & title)
{
  std::string out = title;
  out += '\n';
  render(plan, "", true, out);
  return out;
}

}  // namespace flowplan
