// typecraft/codec/union_resolver.cpp - Backtracking union variant search
//
#include "typecraft/codec/union_resolver.hpp"

#include <fmt/core.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "typecraft/codec/validator.hpp"
#include "typecraft/types/type_utils.hpp"

namespace typecraft
{

namespace
{

using detail::DecoderState;

struct Candidate
{
  size_t variant;
  const Value * input;
};

std::string union_expectation(const Type * union_type)
{
  std::string names;
  for (const auto & v : union_type->variants) {
    names += names.empty() ? "" : " | ";
    names += v.name;
  }
  return fmt::format("union ({})", names);
}

const Type * require_union(const Type * type)
{
  const Type * t = concretise(type);
  if (t->kind != TypeKind::Union) {
    throw std::logic_error(fmt::format("expected a union type, got {}", to_string(t)));
  }
  return t;
}

DecodeResult search_variants(const Type * u, const Value & raw, const DecoderState & state)
{
  std::vector<Candidate> candidates;
  bool tagged = false;
  if (raw.is_object() && raw.size() == 1) {
    for (const auto & [key, value] : raw.fields()) {
      if (value.is_undefined()) {
        continue;
      }
      const size_t idx = u->variant_index(key);
      if (idx < u->variants.size()) {
        candidates.push_back(Candidate{idx, &value});
        tagged = true;
      }
    }
  }
  if (state.bare_unions) {
    for (size_t i = 0; i < u->variants.size(); ++i) {
      candidates.push_back(Candidate{i, &raw});
    }
  }

  // First decoded variant, kept when no candidate also validates
  std::optional<Value> potential;
  DecodingErrors errors;

  for (const auto & candidate : candidates) {
    const Variant & variant = u->variants[candidate.variant];
    auto result = detail::decode_node(variant.type, *candidate.input, state);
    if (result.is_ok()) {
      if (validate(variant.type, result.value()).is_ok()) {
        return result;
      }
      if (!potential) {
        potential = std::move(result).value();
      }
      continue;
    }
    auto variant_errors = std::move(result).error();
    prepend_variant(variant_errors, variant.name);
    append_errors(errors, std::move(variant_errors));
  }

  if (potential) {
    return DecodeResult::ok(std::move(*potential));
  }
  if (!tagged) {
    errors.insert(errors.begin(), DecodingError{Path{}, union_expectation(u), raw});
  }
  if (state.options.stop_at_first_error() && errors.size() > 1) {
    errors.resize(1);
  }
  return DecodeResult::fail(std::move(errors));
}

}  // namespace

DecodeResult detail::decode_union(
  const Type * union_type, const Value & raw, const DecoderState & state)
{
  const Type * u = require_union(union_type);

  // Prefer the variant matching without leniency
  if (state.options.try_casting() || state.options.allow_additional_fields()) {
    DecoderState exact = state;
    exact.options.type_casting = TypeCastingStrategy::ExpectExactTypes;
    exact.options.field_strictness = FieldStrictness::ExpectExactFields;
    auto result = search_variants(u, raw, exact);
    if (result.is_ok()) {
      return result;
    }
  }
  return search_variants(u, raw, state);
}

std::optional<size_t> find_variant_owner(const Type * union_type, const Value & value)
{
  const Type * u = require_union(union_type);
  const DecoderState exact{DecodingOptions{}, true};

  std::optional<size_t> first_decoded;
  for (size_t i = 0; i < u->variants.size(); ++i) {
    const Variant & variant = u->variants[i];
    auto result = detail::decode_node(variant.type, value, exact);
    if (result.is_error()) {
      continue;
    }
    if (validate(variant.type, result.value()).is_ok()) {
      return i;
    }
    if (!first_decoded) {
      first_decoded = i;
    }
  }
  return first_decoded;
}

std::string variant_ownership(const Type * union_type, const Value & value)
{
  const auto owner = find_variant_owner(union_type, value);
  if (!owner) {
    throw std::logic_error(fmt::format(
      "value {} does not belong to any variant of {}", value.to_string(),
      to_string(union_type)));
  }
  return concretise(union_type)->variants[*owner].name;
}

}  // namespace typecraft
