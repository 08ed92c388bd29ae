// typecraft/codec/validator.cpp - Per-kind semantic validation
//
#include "typecraft/codec/validator.hpp"

#include <fmt/core.h>

#include <cmath>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>

#include "typecraft/codec/union_resolver.hpp"
#include "typecraft/types/type_utils.hpp"

namespace typecraft
{

namespace
{

/**
 * Collects errors for one node and tells the caller when to stop.
 */
class ErrorSink
{
public:
  explicit ErrorSink(const ValidationOptions & options) : options_(options) {}

  /// Record a failed assertion; returns true when validation must stop
  bool fail(std::string assertion, const Value & got)
  {
    errors_.push_back(ValidationError{Path{}, std::move(assertion), got});
    return options_.stop_at_first_error();
  }

  /// Record child errors; returns true when validation must stop
  bool merge(ValidationErrors && child)
  {
    if (child.empty()) {
      return false;
    }
    append_errors(errors_, std::move(child));
    return options_.stop_at_first_error();
  }

  ValidationResult finish()
  {
    if (errors_.empty()) {
      return ValidationResult::ok();
    }
    return ValidationResult::fail(std::move(errors_));
  }

private:
  const ValidationOptions & options_;
  ValidationErrors errors_;
};

ValidationResult validate_node(
  const Type * type, const Value & value, const ValidationOptions & options);

/// Number of Unicode code points in a UTF-8 string
size_t code_points(const std::string & text)
{
  size_t count = 0;
  for (const char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

ValidationResult validate_string(
  const Type * type, const Value & value, const ValidationOptions & options)
{
  ErrorSink sink(options);
  const StringOptions & o = type->string_options;
  const size_t length = code_points(value.as_string());

  if (o.max_length && length > *o.max_length) {
    if (sink.fail(fmt::format("string longer than max length ({})", *o.max_length), value)) {
      return sink.finish();
    }
  }
  if (o.min_length && length < *o.min_length) {
    if (sink.fail(fmt::format("string shorter than min length ({})", *o.min_length), value)) {
      return sink.finish();
    }
  }
  if (type->pattern && !std::regex_match(value.as_string(), *type->pattern)) {
    sink.fail(fmt::format("string regex mismatch ({})", *o.regex), value);
  }
  return sink.finish();
}

ValidationResult validate_number(
  const Type * type, const Value & value, const ValidationOptions & options)
{
  ErrorSink sink(options);
  const NumberOptions & o = type->number_options;
  const double n = value.as_number();

  if (o.maximum && n > *o.maximum) {
    if (sink.fail(fmt::format("number must be less than or equal to {}", *o.maximum), value)) {
      return sink.finish();
    }
  }
  if (o.exclusive_maximum && n >= *o.exclusive_maximum) {
    if (sink.fail(fmt::format("number must be less than {}", *o.exclusive_maximum), value)) {
      return sink.finish();
    }
  }
  if (o.minimum && n < *o.minimum) {
    if (sink.fail(fmt::format("number must be greater than or equal to {}", *o.minimum), value)) {
      return sink.finish();
    }
  }
  if (o.exclusive_minimum && n <= *o.exclusive_minimum) {
    if (sink.fail(fmt::format("number must be greater than {}", *o.exclusive_minimum), value)) {
      return sink.finish();
    }
  }
  if (type->is_integer && !value.is_integral()) {
    sink.fail("number must be an integer", value);
  }
  return sink.finish();
}

ValidationResult validate_array(
  const Type * type, const Value & value, const ValidationOptions & options)
{
  ErrorSink sink(options);
  const ArrayOptions & o = type->array_options;
  const auto items = value.as_array();

  if (o.max_items && items.size() > *o.max_items) {
    if (sink.fail(fmt::format("array must have at most {} items", *o.max_items), value)) {
      return sink.finish();
    }
  }
  if (o.min_items && items.size() < *o.min_items) {
    if (sink.fail(fmt::format("array must have at least {} items", *o.min_items), value)) {
      return sink.finish();
    }
  }

  for (size_t i = 0; i < items.size(); ++i) {
    auto result = validate_node(type->inner, items[i], options);
    if (result.is_ok()) {
      continue;
    }
    auto item_errors = std::move(result).error();
    prepend_index(item_errors, i);
    if (sink.merge(std::move(item_errors))) {
      break;
    }
  }
  return sink.finish();
}

ValidationResult validate_record(
  const Type * type, const Value & value, const ValidationOptions & options)
{
  ErrorSink sink(options);
  for (const auto & field : type->fields) {
    const Value * field_value = value.find(field.name);
    if (field_value == nullptr) {
      continue;
    }
    auto result = validate_node(field.type, *field_value, options);
    if (result.is_ok()) {
      continue;
    }
    auto field_errors = std::move(result).error();
    prepend_field(field_errors, field.name);
    if (sink.merge(std::move(field_errors))) {
      break;
    }
  }
  return sink.finish();
}

ValidationResult validate_union(
  const Type * type, const Value & value, const ValidationOptions & options)
{
  const Variant & variant = type->variants[type->variant_index(variant_ownership(type, value))];
  auto result = validate_node(variant.type, value, options);
  if (result.is_ok()) {
    return result;
  }
  auto errors = std::move(result).error();
  prepend_variant(errors, variant.name);
  return ValidationResult::fail(std::move(errors));
}

ValidationResult validate_node(
  const Type * type, const Value & value, const ValidationOptions & options)
{
  const Type * t = concretise(type);
  switch (t->kind) {
    case TypeKind::String:
      return value.is_string() ? validate_string(t, value, options) : ValidationResult::ok();
    case TypeKind::Number:
      return value.is_number() ? validate_number(t, value, options) : ValidationResult::ok();
    case TypeKind::Boolean:
    case TypeKind::Literal:
    case TypeKind::Enum:
      return ValidationResult::ok();
    case TypeKind::Object:
    case TypeKind::Entity:
      return value.is_object() ? validate_record(t, value, options) : ValidationResult::ok();
    case TypeKind::Array:
      return value.is_array() ? validate_array(t, value, options) : ValidationResult::ok();
    case TypeKind::Optional:
      return value.is_undefined() ? ValidationResult::ok() : validate_node(t->inner, value, options);
    case TypeKind::Nullable:
      return value.is_null() ? ValidationResult::ok() : validate_node(t->inner, value, options);
    case TypeKind::Reference:
      return validate_node(t->inner, value, options);
    case TypeKind::Union:
      return validate_union(t, value, options);
    case TypeKind::Custom:
      return t->codec.validate(value, options, t->custom_options);
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected lazy type after concretise");
}

}  // namespace

ValidationResult validate(const Type * type, const Value & value, const ValidationOptions & options)
{
  return validate_node(type, value, options);
}

}  // namespace typecraft
