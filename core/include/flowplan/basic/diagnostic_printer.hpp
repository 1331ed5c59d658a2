// flowplan/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their workflow location, related nodes and help in
// Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "flowplan/basic/diagnostic.hpp"

namespace flowplan
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0403]: duplicate task name 'writer'
 *     --> region 'Main' (tab1) / node 'writer' (n3)
 *         |
 *         ^ redefined here
 *         - first used here: region 'Main' (tab1) / node 'writer' (n1)
 *         |
 *         = help: task names must be unique within a workflow
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags);

  /**
   * Print a one-line summary such as "2 errors, 1 warning".
   */
  void print_summary(const DiagnosticBag & diags);

private:
  // Rust-style formatting helpers
  void print_severity_header(const Diagnostic & diag);
  void print_note(std::string_view note);
  void print_related(const RelatedLocation & related);
  void print_help(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace flowplan
