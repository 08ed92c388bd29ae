// typecraft/codec/encoder.cpp - Per-kind encoding
//
#include "typecraft/codec/encoder.hpp"

#include <stdexcept>
#include <utility>

#include "typecraft/codec/union_resolver.hpp"
#include "typecraft/codec/validator.hpp"
#include "typecraft/types/type_utils.hpp"

namespace typecraft
{

namespace
{

nlohmann::json encode_node(const Type * type, const Value & value, const EncodingOptions & options);

nlohmann::json encode_record(const Type * type, const Value & value, const EncodingOptions & options)
{
  nlohmann::json out = nlohmann::json::object();
  for (const auto & field : type->fields) {
    const Value * field_value = value.find(field.name);
    if (field_value == nullptr) {
      continue;
    }
    nlohmann::json encoded = encode_node(field.type, *field_value, options);
    if (encoded.is_null() && is_optional(field.type)) {
      continue;
    }
    out[field.name] = std::move(encoded);
  }
  return out;
}

nlohmann::json encode_array(const Type * type, const Value & value, const EncodingOptions & options)
{
  nlohmann::json out = nlohmann::json::array();
  for (const auto & item : value.as_array()) {
    out.push_back(encode_node(type->inner, item, options));
  }
  return out;
}

nlohmann::json encode_union(const Type * type, const Value & value, const EncodingOptions & options)
{
  const Variant * variant = type->find_variant(variant_ownership(type, value));
  nlohmann::json out = nlohmann::json::object();
  out[variant->name] = encode_node(variant->type, value, options);
  return out;
}

nlohmann::json encode_node(const Type * type, const Value & value, const EncodingOptions & options)
{
  const Type * t = concretise(type);
  if (t->options.sensitive && options.hide_sensitive()) {
    return nullptr;
  }

  switch (t->kind) {
    case TypeKind::String:
    case TypeKind::Number:
    case TypeKind::Boolean:
    case TypeKind::Literal:
    case TypeKind::Enum:
      return value.to_json();
    case TypeKind::Object:
    case TypeKind::Entity:
      return encode_record(t, value, options);
    case TypeKind::Array:
      return encode_array(t, value, options);
    case TypeKind::Optional:
      return value.is_undefined() ? nlohmann::json(nullptr) : encode_node(t->inner, value, options);
    case TypeKind::Nullable:
      return value.is_null() ? nlohmann::json(nullptr) : encode_node(t->inner, value, options);
    case TypeKind::Reference:
      return encode_node(t->inner, value, options);
    case TypeKind::Union:
      return encode_union(t, value, options);
    case TypeKind::Custom:
      return t->codec.encode(value, options, t->custom_options);
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected lazy type after concretise");
}

}  // namespace

nlohmann::json encode_without_validation(
  const Type * type, const Value & value, const EncodingOptions & options)
{
  return encode_node(type, value, options);
}

EncodeResult encode(
  const Type * type, const Value & value, const EncodingOptions & encoding,
  const ValidationOptions & validation)
{
  auto validated = validate(type, value, validation);
  if (validated.is_error()) {
    return EncodeResult::fail(std::move(validated).error());
  }
  return EncodeResult::ok(encode_node(type, value, encoding));
}

}  // namespace typecraft
