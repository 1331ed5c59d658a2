// flowplan/basic/diagnostic.hpp - Diagnostics collected while building and validating a workflow
//
// A diagnostic points at one workflow element (a node, a region or a referenced
// file) and may name related nodes, e.g. the first definition of a duplicate
// name or the other members of a cycle.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flowplan/basic/location.hpp"

namespace flowplan
{

enum class Severity : uint8_t {
  Error,    // blocks the build in strict mode
  Warning,  // reported, never blocks
};

[[nodiscard]] const char * to_string(Severity severity) noexcept;

/**
 * Category of a diagnostic. Errors of kind Structural and Cycle are also
 * raised as exceptions (see errors.hpp); the others are only ever collected.
 */
enum class ErrorKind : uint8_t {
  Structural,  // unknown edge endpoint, duplicate link name, duplicate node id
  Cycle,       // SEQUENTIAL-edge cycle
  Reference,   // missing external content
  Config,      // invalid or suspicious node configuration
  Internal,
};

[[nodiscard]] const char * to_string(ErrorKind kind) noexcept;

/// Another element that explains a diagnostic.
struct RelatedLocation
{
  Location location;
  std::string note;  // e.g. "first used here"
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  ErrorKind kind = ErrorKind::Config;
  std::string code;  // "E0301", "W0501", ...
  std::string message;

  Location location;
  std::string note;  // shown under the location; may be empty
  std::vector<RelatedLocation> related;
  std::optional<std::string> help;

  [[nodiscard]] static Diagnostic error(
    ErrorKind kind, std::string code, Location location, std::string message);
  [[nodiscard]] static Diagnostic warning(
    std::string code, Location location, std::string message);

  // Decorators, chainable on a stored diagnostic
  Diagnostic & noted(std::string text);
  Diagnostic & see_also(Location location, std::string note);
  Diagnostic & with_help(std::string text);

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }
};

/**
 * Ordered collection of diagnostics for one compilation.
 */
class DiagnosticBag
{
public:
  /**
   * Append a diagnostic and return it for decoration:
   *
   *   diags.error(ErrorKind::Reference, "E0301", loc, "missing prompt")
   *     .noted("referenced here")
   *     .with_help("add the file");
   *
   * The reference stays valid until the next diagnostic is appended.
   */
  Diagnostic & error(ErrorKind kind, std::string code, Location location, std::string message);
  Diagnostic & warning(std::string code, Location location, std::string message);

  Diagnostic & add(Diagnostic diag);
  void merge(DiagnosticBag other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }
  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  /// Errors of one kind.
  [[nodiscard]] std::vector<Diagnostic> of_kind(ErrorKind kind) const;
  [[nodiscard]] std::vector<Diagnostic> with_code(std::string_view code) const;

  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }
  [[nodiscard]] size_t warning_count() const noexcept { return size() - error_count_; }
  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] bool has_warnings() const noexcept { return warning_count() > 0; }

private:
  template <typename Pred>
  std::vector<Diagnostic> select(Pred pred) const;

  std::vector<Diagnostic> diagnostics_;
  size_t error_count_ = 0;
};

}  // namespace flowplan
