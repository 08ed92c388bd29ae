// typecraft/codec/union_resolver.hpp - Union variant resolution
//
// Unions are written as a single-key tagged object {variant: value};
// under TryCasting a bare value is also matched by trial. Decoded
// union values hold the bare variant value.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "typecraft/basic/value.hpp"
#include "typecraft/codec/decoder.hpp"
#include "typecraft/codec/errors.hpp"
#include "typecraft/types/type.hpp"

namespace typecraft
{

/**
 * Find the variant owning an already decoded union value.
 *
 * Variants are tried in declaration order with exact decoding: the
 * first that decodes and validates wins, otherwise the first that
 * merely decodes.
 *
 * @param union_type Union type (may be lazy)
 * @param value Bare variant value
 * @return Variant index, or nullopt when no variant matches
 */
[[nodiscard]] std::optional<size_t> find_variant_owner(const Type * union_type, const Value & value);

/**
 * Name of the variant owning a union value.
 *
 * @throws std::logic_error when no variant matches (the value was not
 *         produced by decoding against this union)
 */
[[nodiscard]] std::string variant_ownership(const Type * union_type, const Value & value);

namespace detail
{

/**
 * Decode a raw value against a union.
 *
 * Candidates: the tagged variant when `raw` is a single-key object
 * naming a variant, then every variant with the bare value when bare
 * unions are enabled. The first candidate that decodes and validates
 * wins; otherwise the first that decoded is returned. Under casting or
 * additional fields, an exact pass runs first.
 */
DecodeResult decode_union(const Type * union_type, const Value & raw, const DecoderState & state);

}  // namespace detail

}  // namespace typecraft
