// flowplan/basic/diagnostic.cpp - Diagnostic construction and the bag
#include "flowplan/basic/diagnostic.hpp"

#include <utility>

namespace flowplan
{

const char * to_string(Severity severity) noexcept
{
  return severity == Severity::Error ? "error" : "warning";
}

const char * to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Structural:
      return "structural";
    case ErrorKind::Cycle:
      return "cycle";
    case ErrorKind::Reference:
      return "reference";
    case ErrorKind::Config:
      return "config";
    case ErrorKind::Internal:
      return "internal";
  }
  return "internal";
}

// ============================================================================
// Diagnostic
// ============================================================================

Diagnostic Diagnostic::error(
  ErrorKind kind, std::string code, Location location, std::string message)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.kind = kind;
  d.code = std::move(code);
  d.location = std::move(location);
  d.message = std::move(message);
  return d;
}

// Warnings are always about configuration: structure, cycles and missing
// references are errors.
Diagnostic Diagnostic::warning(std::string code, Location location, std::string message)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.kind = ErrorKind::Config;
  d.code = std::move(code);
  d.location = std::move(location);
  d.message = std::move(message);
  return d;
}

Diagnostic & Diagnostic::noted(std::string text)
{
  note = std::move(text);
  return *this;
}

Diagnostic & Diagnostic::see_also(Location other, std::string text)
{
  related.push_back(RelatedLocation{std::move(other), std::move(text)});
  return *this;
}

Diagnostic & Diagnostic::with_help(std::string text)
{
  help = std::move(text);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

Diagnostic & DiagnosticBag::error(
  ErrorKind kind, std::string code, Location location, std::string message)
{
  return add(Diagnostic::error(kind, std::move(code), std::move(location), std::move(message)));
}

Diagnostic & DiagnosticBag::warning(std::string code, Location location, std::string message)
{
  return add(Diagnostic::warning(std::move(code), std::move(location), std::move(message)));
}

Diagnostic & DiagnosticBag::add(Diagnostic diag)
{
  if (diag.is_error()) ++error_count_;
  diagnostics_.push_back(std::move(diag));
  return diagnostics_.back();
}

void DiagnosticBag::merge(DiagnosticBag other)
{
  diagnostics_.reserve(diagnostics_.size() + other.diagnostics_.size());
  for (auto & d : other.diagnostics_) {
    add(std::move(d));
  }
}

template <typename Pred>
std::vector<Diagnostic> DiagnosticBag::select(Pred pred) const
{
  std::vector<Diagnostic> out;
  for (const auto & d : diagnostics_) {
    if (pred(d)) out.push_back(d);
  }
  return out;
}

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  return select([](const Diagnostic & d) { return d.is_error(); });
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  return select([](const Diagnostic & d) { return !d.is_error(); });
}

std::vector<Diagnostic> DiagnosticBag::of_kind(ErrorKind kind) const
{
  return select([kind](const Diagnostic & d) { return d.is_error() && d.kind == kind; });
}

std::vector<Diagnostic> DiagnosticBag::with_code(std::string_view code) const
{
  return select([code](const Diagnostic & d) { return d.code == code; });
}

}  // namespace flowplan
