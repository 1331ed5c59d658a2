// flowplan/basic/location.cpp - Location formatting
#include "flowplan/basic/location.hpp"

namespace flowplan
{

std::string Location::to_string() const
{
  std::string out;
  if (has_region()) {
    if (!region_name.empty()) {
      out += "region '" + region_name + "' (" + region_id + ")";
    } else {
      out += "region " + region_id;
    }
  }
  if (has_node()) {
    if (!out.empty()) out += " / ";
    if (!node_name.empty()) {
      out += "node '" + node_name + "' (" + node_id + ")";
    } else {
      out += "node " + node_id;
    }
  }
  if (file_path) {
    if (!out.empty()) out += " / ";
    out += *file_path;
    if (line > 0) {
      out += ":" + std::to_string(line);
    }
  }
  if (out.empty()) {
    out = "<workflow>";
  }
  return out;
}

}  // namespace flowplan
