// typecraft/codec/decoder.hpp - Untyped input to typed value
//
// Decoding checks shape only. Semantic constraints (ranges, lengths,
// patterns) are checked by the validator.
//
#pragma once

#include <nlohmann/json.hpp>

#include "typecraft/basic/value.hpp"
#include "typecraft/codec/errors.hpp"
#include "typecraft/codec/options.hpp"
#include "typecraft/types/type.hpp"

namespace typecraft
{

/**
 * Decode a raw value without validating it.
 *
 * Never throws for malformed input; errors carry the path of the
 * offending value.
 *
 * @param type Target type (may be lazy)
 * @param raw Untyped input
 * @param options Casting, error reporting and field strictness policies
 * @return Decoded value or path-tagged decoding errors
 * @throws std::logic_error on a broken type graph
 */
[[nodiscard]] DecodeResult decode(
  const Type * type, const Value & raw, const DecodingOptions & options = {});

/// Decode a JSON document
[[nodiscard]] DecodeResult decode(
  const Type * type, const nlohmann::json & raw, const DecodingOptions & options = {});

/**
 * Decode, then validate the decoded value.
 *
 * @return Decoded value, or the decoding errors, or the validation errors
 */
[[nodiscard]] DecodeAndValidateResult decode_and_validate(
  const Type * type, const Value & raw, const DecodingOptions & decoding = {},
  const ValidationOptions & validation = {});

[[nodiscard]] DecodeAndValidateResult decode_and_validate(
  const Type * type, const nlohmann::json & raw, const DecodingOptions & decoding = {},
  const ValidationOptions & validation = {});

namespace detail
{

/**
 * State threaded through a decoding walk.
 *
 * `bare_unions` lets unions match an untagged value by trial. It is set
 * under TryCasting and when classifying already decoded values.
 */
struct DecoderState
{
  DecodingOptions options;
  bool bare_unions = false;
};

DecodeResult decode_node(const Type * type, const Value & raw, const DecoderState & state);

}  // namespace detail

}  // namespace typecraft
