// typecraft/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
#include "typecraft/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace typecraft
{

namespace
{

/// Longest snippet printed before eliding the rest
constexpr size_t k_max_snippet_width = 60;

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

/// Single line rendering of a value, elided past the max width
std::string one_line(std::string_view snippet)
{
  std::string line(snippet);
  for (char & c : line) {
    if (c == '\n' || c == '\r' || c == '\t') {
      c = ' ';
    }
  }
  if (line.size() > k_max_snippet_width) {
    line.resize(k_max_snippet_width - 3);
    line += "...";
  }
  return line;
}

std::string plural(size_t count, std::string_view noun)
{
  return fmt::format("{} {}{}", count, noun, count == 1 ? "" : "s");
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  print_header(diag);

  gutter("  -->");
  fmt::print(os_, " {}\n", diag.path.to_string());

  if (!diag.snippet.empty()) {
    gutter("      |");
    fmt::print(os_, "\n");
    print_snippet(diag.snippet, diag.label_message);
  }

  if (diag.help_message) {
    gutter("      |");
    fmt::print(os_, "\n");
    gutter("      =");
    fmt::print(os_, " help: {}\n", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  for (const auto & d : diags) {
    print(d);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.count(Severity::Error);
  const size_t warnings = diags.count(Severity::Warning);
  if (errors == 0 && warnings == 0) {
    return;
  }

  std::string text;
  if (errors > 0) {
    text = plural(errors, "error");
  }
  if (warnings > 0) {
    text += text.empty() ? "" : ", ";
    text += plural(warnings, "warning");
  }
  styled(errors > 0 ? "error" : "warning", errors > 0 ? Tone::Error : Tone::Warning);
  fmt::print(os_, ": {}\n", text);
}

// ============================================================================
// Private helpers
// ============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  std::string head(severity_name(diag.severity));
  if (!diag.code.empty()) {
    head += fmt::format("[{}]", diag.code);
  }
  styled(head, diag.severity == Severity::Warning ? Tone::Warning : Tone::Error);
  fmt::print(os_, ": {}\n", diag.message);
}

void DiagnosticPrinter::print_snippet(std::string_view snippet, std::string_view label)
{
  const std::string line = one_line(snippet);

  gutter("      |");
  fmt::print(os_, " {}\n", line);

  gutter("      |");
  fmt::print(os_, " ");
  std::string marker(line.size(), '^');
  if (!label.empty()) {
    marker += fmt::format(" {}", label);
  }
  styled(marker, Tone::Error);
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::styled(std::string_view text, Tone tone)
{
  if (!use_color_) {
    os_ << text;
    return;
  }
  rang::fg color = rang::fg::cyan;
  switch (tone) {
    case Tone::Error:
      color = rang::fg::red;
      break;
    case Tone::Warning:
      color = rang::fg::yellow;
      break;
    case Tone::Gutter:
      break;
  }
  os_ << rang::style::bold << color << text << rang::fg::reset << rang::style::reset;
}

void DiagnosticPrinter::gutter(std::string_view mark) { styled(mark, Tone::Gutter); }

}  // namespace typecraft
