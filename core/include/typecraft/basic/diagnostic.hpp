// typecraft/basic/diagnostic.hpp - Diagnostics for decoding/validation reports
//
// A diagnostic locates a problem by the Path of the offending value
// rather than by a source range; the value itself is kept as a snippet.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "typecraft/basic/path.hpp"

namespace typecraft
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  ///< "D001" decoding, "V001" validation
  std::string message;

  Path path;
  std::string snippet;        ///< Offending value, rendered
  std::string label_message;  ///< Shown under the snippet
  std::optional<std::string> help_message;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent decoration of a diagnostic being reported.
 *
 * The diagnostic is added to its bag when the builder is destroyed, so
 * a builder discarded at the end of a full expression reports at once.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diagnostic);
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  ~DiagnosticBuilder();

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_snippet(std::string snippet);
  DiagnosticBuilder & with_help(std::string help);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/**
 * Ordered collection of diagnostics.
 */
class DiagnosticBag
{
public:
  DiagnosticBuilder report(
    Severity severity, Path path, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(Path path, std::string message, std::string label_message = "")
  {
    return report(Severity::Error, std::move(path), std::move(message), std::move(label_message));
  }

  DiagnosticBuilder report_warning(
    Path path, std::string message, std::string label_message = "")
  {
    return report(
      Severity::Warning, std::move(path), std::move(message), std::move(label_message));
  }

  void add(Diagnostic diagnostic) { diagnostics_.push_back(std::move(diagnostic)); }

  /// Move every diagnostic of `other` to the end of this bag
  void merge(DiagnosticBag && other);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) > 0; }

  [[nodiscard]] std::vector<Diagnostic> errors() const { return with_severity(Severity::Error); }
  [[nodiscard]] std::vector<Diagnostic> warnings() const
  {
    return with_severity(Severity::Warning);
  }

  /// Diagnostics located at `prefix` or inside it, e.g. every error of one field
  [[nodiscard]] std::vector<Diagnostic> under(const Path & prefix) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  [[nodiscard]] std::vector<Diagnostic> with_severity(Severity severity) const;

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace typecraft
