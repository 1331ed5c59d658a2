// flowplan/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "flowplan/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace flowplan
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> region / node / file ===
  fmt::print(os_, "{} {}\n", gutter_arrow(), diag.location.to_string());

  // === Note and related nodes ===
  if (!diag.note.empty() || !diag.related.empty()) {
    fmt::print(os_, "{}\n", gutter_pipe());
  }
  if (!diag.note.empty()) {
    print_note(diag.note);
  }
  for (const auto & related : diag.related) {
    print_related(related);
  }

  // === Help message ===
  if (diag.help) {
    print_help(*diag.help);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Errors before warnings; report order otherwise (stable)
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.is_error() && !b.is_error();
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.error_count();
  const size_t warnings = diags.warning_count();
  if (errors == 0 && warnings == 0) return;

  const std::string text = fmt::format(
    "{} error{}, {} warning{}", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::yellow) << text
        << rang::fg::reset << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", text);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string severity = to_string(diag.severity);
  const std::string tag = diag.code.empty() ? severity : fmt::format("{}[{}]", severity, diag.code);

  if (use_color_) {
    os_ << rang::style::bold << (diag.is_error() ? rang::fg::red : rang::fg::yellow) << tag
        << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", tag, diag.message);
  }
}

void DiagnosticPrinter::print_note(std::string_view note)
{
  fmt::print(os_, "      ");
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "^ {}", note);
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "^ {}", note);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_related(const RelatedLocation & related)
{
  std::string text = related.note;
  if (related.location.is_valid()) {
    text += ": " + related.location.to_string();
  }

  fmt::print(os_, "      ");
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, "- {}", text);
    os_ << rang::fg::reset;
  } else {
    fmt::print(os_, "- {}", text);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace flowplan
