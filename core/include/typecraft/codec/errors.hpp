// typecraft/codec/errors.hpp - Decoding and validation error values
//
#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "typecraft/basic/path.hpp"
#include "typecraft/basic/result.hpp"
#include "typecraft/basic/value.hpp"

namespace typecraft
{

// ============================================================================
// Error Values
// ============================================================================

/**
 * Shape mismatch found while decoding.
 */
struct DecodingError
{
  Path path;
  std::string expected;  ///< e.g. "number", "enum (\"A\" | \"B\")"
  Value got;
};

/**
 * Semantic constraint violation found while validating.
 */
struct ValidationError
{
  Path path;
  std::string assertion;  ///< e.g. "string longer than max length (3)"
  Value got;
};

using DecodingErrors = std::vector<DecodingError>;
using ValidationErrors = std::vector<ValidationError>;

using DecodeResult = Result<Value, DecodingErrors>;
using ValidationResult = Result<void, ValidationErrors>;

using DecodeAndValidateErrors = std::variant<DecodingErrors, ValidationErrors>;
using DecodeAndValidateResult = Result<Value, DecodeAndValidateErrors>;

// ============================================================================
// Path Prefixing
// ============================================================================

template <typename ErrorT>
void prepend_field(std::vector<ErrorT> & errors, std::string_view name)
{
  for (auto & e : errors) {
    e.path = e.path.prepend_field(name);
  }
}

template <typename ErrorT>
void prepend_index(std::vector<ErrorT> & errors, size_t index)
{
  for (auto & e : errors) {
    e.path = e.path.prepend_index(index);
  }
}

template <typename ErrorT>
void prepend_variant(std::vector<ErrorT> & errors, std::string_view name)
{
  for (auto & e : errors) {
    e.path = e.path.prepend_variant(name);
  }
}

/// Move every error of `from` to the end of `to`
template <typename ErrorT>
void append_errors(std::vector<ErrorT> & to, std::vector<ErrorT> && from)
{
  to.insert(to.end(), std::make_move_iterator(from.begin()), std::make_move_iterator(from.end()));
}

}  // namespace typecraft
