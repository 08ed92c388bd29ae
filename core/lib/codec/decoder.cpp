// typecraft/codec/decoder.cpp - Per-kind decoding
//
#include "typecraft/codec/decoder.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "typecraft/codec/union_resolver.hpp"
#include "typecraft/codec/validator.hpp"
#include "typecraft/types/type_utils.hpp"

namespace typecraft
{

namespace
{

using detail::DecoderState;

DecodeResult mismatch(std::string expected, const Value & got)
{
  return DecodeResult::fail({DecodingError{Path{}, std::move(expected), got}});
}

/// Append " or <alternative>" to every expected description
DecodingErrors add_expected(DecodingErrors errors, std::string_view alternative)
{
  for (auto & e : errors) {
    e.expected = fmt::format("{} or {}", e.expected, alternative);
  }
  return errors;
}

std::optional<double> parse_number(const std::string & text)
{
  if (text.empty()) {
    return std::nullopt;
  }
  const char * first = text.data();
  const char * last = text.data() + text.size();
  if (*first == '+') {
    ++first;
  }
  double parsed = 0.0;
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

// ============================================================================
// Scalars
// ============================================================================

DecodeResult decode_string(const Value & raw, const DecoderState & state)
{
  if (raw.is_string()) {
    return DecodeResult::ok(raw);
  }
  if (state.options.try_casting()) {
    if (raw.is_number()) {
      return DecodeResult::ok(Value::make_string(fmt::format("{}", raw.as_number())));
    }
    if (raw.is_bool()) {
      return DecodeResult::ok(Value::make_string(raw.as_bool() ? "true" : "false"));
    }
  }
  return mismatch("string", raw);
}

DecodeResult decode_number(const Type * type, const Value & raw, const DecoderState & state)
{
  const char * expected = type->is_integer ? "integer" : "number";
  if (raw.is_number()) {
    return DecodeResult::ok(raw);
  }
  if (state.options.try_casting() && raw.is_string()) {
    if (const auto parsed = parse_number(raw.as_string())) {
      return DecodeResult::ok(Value::make_number(*parsed));
    }
  }
  return mismatch(expected, raw);
}

DecodeResult decode_boolean(const Value & raw, const DecoderState & state)
{
  if (raw.is_bool()) {
    return DecodeResult::ok(raw);
  }
  if (state.options.try_casting()) {
    if (raw.is_string() && (raw.as_string() == "true" || raw.as_string() == "false")) {
      return DecodeResult::ok(Value::make_bool(raw.as_string() == "true"));
    }
    if (raw.is_number()) {
      return DecodeResult::ok(Value::make_bool(raw.as_number() != 0.0));
    }
  }
  return mismatch("boolean", raw);
}

DecodeResult decode_literal(const Type * type, const Value & raw, const DecoderState & state)
{
  if (raw == type->literal) {
    return DecodeResult::ok(type->literal);
  }
  if (
    state.options.try_casting() && type->literal.is_null() && raw.is_string() &&
    raw.as_string() == "null") {
    return DecodeResult::ok(Value::make_null());
  }
  return mismatch(fmt::format("literal ({})", type->literal.to_string()), raw);
}

DecodeResult decode_enum(const Type * type, const Value & raw)
{
  if (raw.is_string()) {
    for (const auto & variant : type->enum_variants) {
      if (variant == raw.as_string()) {
        return DecodeResult::ok(raw);
      }
    }
  }
  std::string variants;
  for (const auto & variant : type->enum_variants) {
    variants += variants.empty() ? "" : " | ";
    variants += fmt::format("\"{}\"", variant);
  }
  return mismatch(fmt::format("enum ({})", variants), raw);
}

// ============================================================================
// Array
// ============================================================================

/// Reinterpret {"0": a, "1": b} as [a, b]
std::optional<Value> object_as_array(const Value & raw)
{
  Value::Array items(raw.size());
  std::vector<bool> filled(items.size(), false);
  for (const auto & [key, item] : raw.fields()) {
    if (item.is_undefined()) {
      continue;
    }
    size_t index = 0;
    const auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), index);
    if (ec != std::errc{} || ptr != key.data() + key.size() || index >= items.size() ||
        filled[index] || (key.size() > 1 && key.front() == '0')) {
      return std::nullopt;
    }
    items[index] = item;
    filled[index] = true;
  }
  return Value::make_array(std::move(items));
}

DecodeResult decode_array(const Type * type, const Value & raw, const DecoderState & state)
{
  std::optional<Value> converted;
  const Value * source = &raw;
  if (!raw.is_array()) {
    if (state.options.try_casting() && raw.is_object()) {
      converted = object_as_array(raw);
    }
    if (!converted) {
      return mismatch("array", raw);
    }
    source = &*converted;
  }

  Value::Array items;
  items.reserve(source->size());
  DecodingErrors errors;
  const auto elements = source->as_array();
  for (size_t i = 0; i < elements.size(); ++i) {
    auto result = detail::decode_node(type->inner, elements[i], state);
    if (result.is_ok()) {
      items.push_back(std::move(result).value());
      continue;
    }
    auto item_errors = std::move(result).error();
    prepend_index(item_errors, i);
    append_errors(errors, std::move(item_errors));
    if (state.options.stop_at_first_error()) {
      break;
    }
  }

  if (!errors.empty()) {
    return DecodeResult::fail(std::move(errors));
  }
  return DecodeResult::ok(Value::make_array(std::move(items)));
}

// ============================================================================
// Object / Entity
// ============================================================================

DecodeResult decode_record(const Type * type, const Value & raw, const DecoderState & state)
{
  Value input = raw;
  if (raw.is_null() && state.options.try_casting()) {
    input = Value::make_object();
  }
  if (!input.is_object()) {
    return mismatch(std::string(kind_name(type->kind)), raw);
  }

  Value decoded = Value::make_object();
  DecodingErrors errors;

  for (const auto & field : type->fields) {
    auto result = detail::decode_node(field.type, input.get(field.name), state);
    if (result.is_ok()) {
      Value value = std::move(result).value();
      if (!value.is_undefined()) {
        decoded.set(field.name, std::move(value));
      }
      continue;
    }
    auto field_errors = std::move(result).error();
    prepend_field(field_errors, field.name);
    append_errors(errors, std::move(field_errors));
    if (state.options.stop_at_first_error()) {
      return DecodeResult::fail(std::move(errors));
    }
  }

  if (!state.options.allow_additional_fields()) {
    for (const auto & [key, value] : input.fields()) {
      if (value.is_undefined() || type->find_field(key) != nullptr) {
        continue;
      }
      errors.push_back(DecodingError{Path{}.append_field(key), "undefined", value});
      if (state.options.stop_at_first_error()) {
        break;
      }
    }
  }

  if (!errors.empty()) {
    return DecodeResult::fail(std::move(errors));
  }
  return DecodeResult::ok(std::move(decoded));
}

// ============================================================================
// Wrappers
// ============================================================================

DecodeResult decode_optional(const Type * type, const Value & raw, const DecoderState & state)
{
  if (raw.is_undefined()) {
    return DecodeResult::ok(Value::make_undefined());
  }
  auto result = detail::decode_node(type->inner, raw, state);
  if (result.is_ok()) {
    return result;
  }
  if (raw.is_null()) {
    return DecodeResult::ok(Value::make_undefined());
  }
  return DecodeResult::fail(add_expected(std::move(result).error(), "undefined"));
}

DecodeResult decode_nullable(const Type * type, const Value & raw, const DecoderState & state)
{
  if (raw.is_null()) {
    return DecodeResult::ok(Value::make_null());
  }
  if (raw.is_undefined() && state.options.try_casting()) {
    return DecodeResult::ok(Value::make_null());
  }
  auto result = detail::decode_node(type->inner, raw, state);
  if (result.is_ok()) {
    return result;
  }
  return DecodeResult::fail(add_expected(std::move(result).error(), "null"));
}

DecodeResult decode_custom(const Type * type, const Value & raw, const DecoderState & state)
{
  return type->codec.decode(raw, state.options, type->custom_options);
}

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

DecodeResult detail::decode_node(const Type * type, const Value & raw, const DecoderState & state)
{
  const Type * t = concretise(type);
  switch (t->kind) {
    case TypeKind::String:
      return decode_string(raw, state);
    case TypeKind::Number:
      return decode_number(t, raw, state);
    case TypeKind::Boolean:
      return decode_boolean(raw, state);
    case TypeKind::Literal:
      return decode_literal(t, raw, state);
    case TypeKind::Enum:
      return decode_enum(t, raw);
    case TypeKind::Object:
    case TypeKind::Entity:
      return decode_record(t, raw, state);
    case TypeKind::Array:
      return decode_array(t, raw, state);
    case TypeKind::Optional:
      return decode_optional(t, raw, state);
    case TypeKind::Nullable:
      return decode_nullable(t, raw, state);
    case TypeKind::Reference:
      return decode_node(t->inner, raw, state);
    case TypeKind::Union:
      return decode_union(t, raw, state);
    case TypeKind::Custom:
      return decode_custom(t, raw, state);
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected lazy type after concretise");
}

DecodeResult decode(const Type * type, const Value & raw, const DecodingOptions & options)
{
  return detail::decode_node(type, raw, detail::DecoderState{options, options.try_casting()});
}

DecodeResult decode(const Type * type, const nlohmann::json & raw, const DecodingOptions & options)
{
  return decode(type, Value::from_json(raw), options);
}

DecodeAndValidateResult decode_and_validate(
  const Type * type, const Value & raw, const DecodingOptions & decoding,
  const ValidationOptions & validation)
{
  auto decoded = decode(type, raw, decoding);
  if (decoded.is_error()) {
    return DecodeAndValidateResult::fail(std::move(decoded).error());
  }
  auto validated = validate(type, decoded.value(), validation);
  if (validated.is_error()) {
    return DecodeAndValidateResult::fail(std::move(validated).error());
  }
  return DecodeAndValidateResult::ok(std::move(decoded).value());
}

DecodeAndValidateResult decode_and_validate(
  const Type * type, const nlohmann::json & raw, const DecodingOptions & decoding,
  const ValidationOptions & validation)
{
  return decode_and_validate(type, Value::from_json(raw), decoding, validation);
}

}  // namespace typecraft
