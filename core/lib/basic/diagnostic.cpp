// typecraft/basic/diagnostic.cpp - Diagnostic collection
//
#include "typecraft/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace typecraft
{

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diagnostic)
: bag_(&bag), diagnostic_(std::move(diagnostic))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diagnostic_(std::move(other.diagnostic_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_ != nullptr) {
    bag_->add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_snippet(std::string snippet)
{
  diagnostic_.snippet = std::move(snippet);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help)
{
  diagnostic_.help_message = std::move(help);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, Path path, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.path = std::move(path);
  d.message = std::move(message);
  d.label_message = std::move(label_message);
  return DiagnosticBuilder(*this, std::move(d));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticBag::with_severity(Severity severity) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [severity](const Diagnostic & d) { return d.severity == severity; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::under(const Path & prefix) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [&prefix](const Diagnostic & d) { return d.path.starts_with(prefix); });
  return result;
}

}  // namespace typecraft
