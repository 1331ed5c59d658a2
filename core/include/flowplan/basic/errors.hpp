// flowplan/basic/errors.hpp - Fatal compile errors raised as exceptions
//
// The graph builder and the topological sorter are fail-fast: they raise one
// of these instead of returning a partial result. The validator never throws;
// it collects the same kinds into a DiagnosticBag.
//
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "flowplan/basic/diagnostic.hpp"
#include "flowplan/basic/location.hpp"

namespace flowplan
{

/**
 * Base class of all fatal compile errors.
 *
 * Carries the error kind, a diagnostic code and the location of the element
 * that caused the failure.
 */
class CompileError : public std::runtime_error
{
public:
  CompileError(ErrorKind kind, std::string code, const std::string & message, Location location)
  : std::runtime_error(message), kind_(kind), code_(std::move(code)), location_(std::move(location))
  {
  }

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string & code() const noexcept { return code_; }
  [[nodiscard]] const Location & location() const noexcept { return location_; }

  /// Convert into a diagnostic so the driver can report it like any other.
  [[nodiscard]] virtual Diagnostic to_diagnostic() const;

private:
  ErrorKind kind_;
  std::string code_;
  Location location_;
};

/**
 * Malformed graph structure: unknown edge endpoint, duplicate node id,
 * duplicate link name within a region.
 */
class StructuralError : public CompileError
{
public:
  StructuralError(std::string code, const std::string & message, Location location)
  : CompileError(ErrorKind::Structural, std::move(code), message, std::move(location))
  {
  }
};

/**
 * A cycle among SEQUENTIAL edges.
 *
 * `cycle()` lists the node ids along the cycle, closed by repeating the first
 * id at the end (A -> B -> A is {"A", "B", "A"}).
 */
class CycleError : public CompileError
{
public:
  explicit CycleError(std::vector<std::string> cycle);

  [[nodiscard]] const std::vector<std::string> & cycle() const noexcept { return cycle_; }

  [[nodiscard]] Diagnostic to_diagnostic() const override;

  /// Format a cycle as "A -> B -> A".
  [[nodiscard]] static std::string format_cycle(const std::vector<std::string> & cycle);

private:
  std::vector<std::string> cycle_;
};

}  // namespace flowplan
