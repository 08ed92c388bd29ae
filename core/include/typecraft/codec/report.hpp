// typecraft/codec/report.hpp - Decoding/validation errors as diagnostics
//
#pragma once

#include <string_view>

#include "typecraft/basic/diagnostic.hpp"
#include "typecraft/codec/errors.hpp"

namespace typecraft
{

/// Diagnostic code of decoding errors
inline constexpr std::string_view k_decoding_error_code = "D001";

/// Diagnostic code of validation errors
inline constexpr std::string_view k_validation_error_code = "V001";

/**
 * One diagnostic per decoding error, in error order.
 *
 * Message: `expected <expected>, got <value>`; the offending value is
 * the snippet.
 */
[[nodiscard]] DiagnosticBag to_diagnostics(
  const DecodingErrors & errors, Severity severity = Severity::Error);

/// One diagnostic per validation error, message `<assertion>, got <value>`
[[nodiscard]] DiagnosticBag to_diagnostics(
  const ValidationErrors & errors, Severity severity = Severity::Error);

/// Diagnostics of whichever error list decode_and_validate returned
[[nodiscard]] DiagnosticBag to_diagnostics(
  const DecodeAndValidateErrors & errors, Severity severity = Severity::Error);

}  // namespace typecraft
