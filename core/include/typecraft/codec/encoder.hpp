// typecraft/codec/encoder.hpp - Typed value to wire (JSON) value
//
#pragma once

#include <nlohmann/json.hpp>

#include "typecraft/basic/result.hpp"
#include "typecraft/basic/value.hpp"
#include "typecraft/codec/errors.hpp"
#include "typecraft/codec/options.hpp"
#include "typecraft/types/type.hpp"

namespace typecraft
{

using EncodeResult = Result<nlohmann::json, ValidationErrors>;

/**
 * Encode a valid value.
 *
 * Absent values encode as null; record fields that are absent, or
 * optional and encoded as null, are omitted. Unions encode as
 * {variant: value}.
 *
 * @throws std::logic_error if a union value matches none of its variants
 */
[[nodiscard]] nlohmann::json encode_without_validation(
  const Type * type, const Value & value, const EncodingOptions & options = {});

/**
 * Validate, then encode.
 *
 * @return Wire value, or the validation errors
 */
[[nodiscard]] EncodeResult encode(
  const Type * type, const Value & value, const EncodingOptions & encoding = {},
  const ValidationOptions & validation = {});

}  // namespace typecraft
