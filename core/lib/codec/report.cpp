// typecraft/codec/report.cpp - Decoding/validation errors as diagnostics
//
#include "typecraft/codec/report.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace typecraft
{

namespace
{

/// Hint for the common exact-decoding mismatches
std::optional<std::string> decoding_help(const DecodingError & error)
{
  if (error.expected == "undefined") {
    return "unknown field: remove it or decode with AllowAdditionalFields";
  }
  if (error.got.is_string() && (error.expected == "number" || error.expected == "integer" ||
                                error.expected == "boolean")) {
    return "string input can be converted by decoding with TryCasting";
  }
  return std::nullopt;
}

}  // namespace

DiagnosticBag to_diagnostics(const DecodingErrors & errors, Severity severity)
{
  DiagnosticBag bag;
  for (const auto & e : errors) {
    const std::string got = e.got.to_string();
    auto builder = bag.report(
      severity, e.path, fmt::format("expected {}, got {}", e.expected, got),
      fmt::format("expected {}", e.expected));
    builder.with_code(std::string(k_decoding_error_code)).with_snippet(got);
    if (auto help = decoding_help(e)) {
      builder.with_help(std::move(*help));
    }
  }
  return bag;
}

DiagnosticBag to_diagnostics(const ValidationErrors & errors, Severity severity)
{
  DiagnosticBag bag;
  for (const auto & e : errors) {
    const std::string got = e.got.to_string();
    bag.report(severity, e.path, fmt::format("{}, got {}", e.assertion, got), e.assertion)
      .with_code(std::string(k_validation_error_code))
      .with_snippet(got);
  }
  return bag;
}

DiagnosticBag to_diagnostics(const DecodeAndValidateErrors & errors, Severity severity)
{
  return std::visit([severity](const auto & list) { return to_diagnostics(list, severity); }, errors);
}

}  // namespace typecraft
