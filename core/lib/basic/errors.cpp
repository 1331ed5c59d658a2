// flowplan/basic/errors.cpp - Fatal compile errors
#include "flowplan/basic/errors.hpp"

#include <utility>

namespace flowplan
{

Diagnostic CompileError::to_diagnostic() const
{
  return Diagnostic::error(kind_, code_, location_, what());
}

namespace
{

Location cycle_location(const std::vector<std::string> & cycle)
{
  if (cycle.empty()) {
    return {};
  }
  return Location::at_node(cycle.front());
}

}  // namespace

CycleError::CycleError(std::vector<std::string> cycle)
: CompileError(
    ErrorKind::Cycle, "E0201", "cycle detected in sequential flow: " + format_cycle(cycle),
    cycle_location(cycle)),
  cycle_(std::move(cycle))
{
}

Diagnostic CycleError::to_diagnostic() const
{
  Diagnostic d = CompileError::to_diagnostic();
  // The path is closed: its last entry repeats the first.
  for (size_t i = 1; i + 1 < cycle_.size(); ++i) {
    d.see_also(Location::at_node(cycle_[i]), "part of the cycle");
  }
  d.with_help("loops must be expressed with a loop composite node, not with a cycle of edges");
  return d;
}

std::string CycleError::format_cycle(const std::vector<std::string> & cycle)
{
  std::string out;
  for (size_t i = 0; i < cycle.size(); ++i) {
    if (i > 0) out += " -> ";
    out += cycle[i];
  }
  return out;
}

}  // namespace flowplan
