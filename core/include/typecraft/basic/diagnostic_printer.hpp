// typecraft/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "typecraft/basic/diagnostic.hpp"

namespace typecraft
{

/**
 * Prints decoding/validation diagnostics in Rust-style format.
 *
 *   error[D001]: expected number, got "abc"
 *     --> $.user.age
 *      |
 *      | "abc"
 *      | ^^^^^ expected number
 *      |
 *      = help: string input can be converted by decoding with TryCasting
 *
 * Colors go through rang and are only emitted when enabled.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /// Print every diagnostic of a bag, in report order
  void print_all(const DiagnosticBag & diags);

  /// Print `N error(s), M warning(s)` for a bag; nothing for an empty bag
  void print_summary(const DiagnosticBag & diags);

private:
  void print_header(const Diagnostic & diag);
  void print_snippet(std::string_view snippet, std::string_view label);

  enum class Tone {
    Error,
    Warning,
    Gutter,
  };

  /// Write `text`, bold and colored by tone when colors are enabled
  void styled(std::string_view text, Tone tone);

  void gutter(std::string_view mark);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace typecraft
