// typecraft/types/custom_types.hpp - Built-in custom types
//
// Ready-made Custom types for common string and number formats. Each
// one is an ordinary Custom node created in the caller's context.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "typecraft/types/type.hpp"

namespace typecraft
{

// ============================================================================
// Options
// ============================================================================

/// Bounds of a datetime, as ISO-8601 strings
struct DateTimeOptions
{
  std::optional<std::string> minimum;
  std::optional<std::string> maximum;
};

struct JsonOptions
{
  std::optional<size_t> size_limit;  ///< Maximum size of the compact JSON text, in bytes
};

// ============================================================================
// Factories
// ============================================================================

/// TCP port number, an integer in [1, 65535]
[[nodiscard]] const Type * port_type(TypeContext & ctx, TypeOptions options = {});

/// E-mail address string
[[nodiscard]] const Type * email_type(TypeContext & ctx, TypeOptions options = {});

/// UUID string (8-4-4-4-12 hex digits)
[[nodiscard]] const Type * uuid_type(TypeContext & ctx, TypeOptions options = {});

/**
 * Point in time.
 *
 * Decoded values are canonical UTC strings (`2024-01-31T10:00:00.000Z`).
 * Exact decoding accepts ISO-8601 strings; casting also accepts
 * milliseconds since the Unix epoch, as a number or a numeric string.
 *
 * @throws std::invalid_argument if a bound is not a valid ISO-8601 string
 *         or minimum is after maximum
 */
[[nodiscard]] const Type * datetime_type(
  TypeContext & ctx, DateTimeOptions datetime_options = {}, TypeOptions options = {});

/// Any JSON value; an absent value decodes to null
[[nodiscard]] const Type * json_type(
  TypeContext & ctx, JsonOptions json_options = {}, TypeOptions options = {});

/**
 * Type without values.
 *
 * Decoding and validation always fail; encoding and generation throw
 * std::logic_error.
 */
[[nodiscard]] const Type * never_type(TypeContext & ctx, TypeOptions options = {});

// ============================================================================
// Datetime Helpers
// ============================================================================

/**
 * Parse an ISO-8601 date or date-time.
 *
 * Accepts `YYYY-MM-DD` optionally followed by `T` (or a space) and
 * `HH:MM[:SS[.fff]]` with an optional `Z` or `+HH:MM` offset. A missing
 * offset means UTC.
 *
 * @return Milliseconds since the Unix epoch, or nullopt when malformed
 */
[[nodiscard]] std::optional<int64_t> parse_iso_datetime(std::string_view text);

/// Canonical UTC rendering, years 0000 to 9999
[[nodiscard]] std::string format_iso_datetime(int64_t epoch_ms);

}  // namespace typecraft
