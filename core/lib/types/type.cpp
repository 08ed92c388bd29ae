// typecraft/types/type.cpp - Type context implementation
//
#include "typecraft/types/type.hpp"

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace typecraft
{

namespace
{

[[noreturn]] void fail(const std::string & message) { throw std::invalid_argument(message); }

void require_child(const Type * child, std::string_view what)
{
  if (child == nullptr) {
    fail(fmt::format("{} must not be null", what));
  }
}

void check_finite(const std::optional<double> & bound, std::string_view what)
{
  if (bound && !std::isfinite(*bound)) {
    fail(fmt::format("{} must be a finite number", what));
  }
}

void check_integral(const std::optional<double> & bound, std::string_view what)
{
  if (bound && std::trunc(*bound) != *bound) {
    fail(fmt::format("{} of an integer type must be an integer", what));
  }
}

void check_number_options(const NumberOptions & o, bool is_integer)
{
  check_finite(o.minimum, "minimum");
  check_finite(o.maximum, "maximum");
  check_finite(o.exclusive_minimum, "exclusive minimum");
  check_finite(o.exclusive_maximum, "exclusive maximum");

  if (o.minimum && o.exclusive_minimum) {
    fail("minimum and exclusive minimum cannot both be set");
  }
  if (o.maximum && o.exclusive_maximum) {
    fail("maximum and exclusive maximum cannot both be set");
  }

  if (is_integer) {
    check_integral(o.minimum, "minimum");
    check_integral(o.maximum, "maximum");
    check_integral(o.exclusive_minimum, "exclusive minimum");
    check_integral(o.exclusive_maximum, "exclusive maximum");
  }

  if (o.minimum && o.maximum && *o.minimum > *o.maximum) {
    fail(fmt::format("minimum {} is greater than maximum {}", *o.minimum, *o.maximum));
  }
  if (o.exclusive_minimum && o.maximum && *o.exclusive_minimum >= *o.maximum) {
    fail(fmt::format(
      "exclusive minimum {} must be less than maximum {}", *o.exclusive_minimum, *o.maximum));
  }
  if (o.minimum && o.exclusive_maximum && *o.minimum >= *o.exclusive_maximum) {
    fail(fmt::format(
      "minimum {} must be less than exclusive maximum {}", *o.minimum, *o.exclusive_maximum));
  }
  if (o.exclusive_minimum && o.exclusive_maximum) {
    // Integers need room for at least one value between the bounds
    const double span = *o.exclusive_maximum - *o.exclusive_minimum;
    if (is_integer ? span < 2.0 : span <= 0.0) {
      fail(fmt::format(
        "exclusive bounds ({}, {}) leave no valid value", *o.exclusive_minimum,
        *o.exclusive_maximum));
    }
  }
}

void check_names(const std::vector<std::string> & names, std::string_view what)
{
  std::unordered_set<std::string_view> seen;
  for (const auto & n : names) {
    if (n.empty()) {
      fail(fmt::format("{} names must not be empty", what));
    }
    if (!seen.insert(n).second) {
      fail(fmt::format("duplicate {} name '{}'", what, n));
    }
  }
}

}  // namespace

// ============================================================================
// Type Queries
// ============================================================================

const Field * Type::find_field(std::string_view field_name) const noexcept
{
  for (const auto & f : fields) {
    if (f.name == field_name) {
      return &f;
    }
  }
  return nullptr;
}

const Variant * Type::find_variant(std::string_view variant_name) const noexcept
{
  const size_t idx = variant_index(variant_name);
  return idx < variants.size() ? &variants[idx] : nullptr;
}

size_t Type::variant_index(std::string_view variant_name) const noexcept
{
  for (size_t i = 0; i < variants.size(); ++i) {
    if (variants[i].name == variant_name) {
      return i;
    }
  }
  return variants.size();
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

const Type * TypeContext::intern(Type && type)
{
  types_.push_back(std::move(type));
  return &types_.back();
}

const Type * TypeContext::string_type(StringOptions string_options, TypeOptions options)
{
  if (string_options.min_length && string_options.max_length &&
      *string_options.min_length > *string_options.max_length) {
    fail(fmt::format(
      "min length {} is greater than max length {}", *string_options.min_length,
      *string_options.max_length));
  }

  Type t{TypeKind::String};
  if (string_options.regex) {
    try {
      t.pattern.emplace(*string_options.regex, std::regex::ECMAScript);
    } catch (const std::regex_error & e) {
      fail(fmt::format("invalid regex '{}': {}", *string_options.regex, e.what()));
    }
  }
  t.string_options = std::move(string_options);
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::make_number(
  NumberOptions number_options, bool is_integer, TypeOptions options)
{
  check_number_options(number_options, is_integer);

  Type t{TypeKind::Number};
  t.number_options = number_options;
  t.is_integer = is_integer;
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::number_type(NumberOptions number_options, TypeOptions options)
{
  return make_number(number_options, false, std::move(options));
}

const Type * TypeContext::integer_type(NumberOptions number_options, TypeOptions options)
{
  return make_number(number_options, true, std::move(options));
}

const Type * TypeContext::boolean_type(TypeOptions options)
{
  Type t{TypeKind::Boolean};
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::literal_type(Value literal, TypeOptions options)
{
  if (!literal.is_null() && !literal.is_bool() && !literal.is_number() && !literal.is_string()) {
    fail("literal value must be null, a boolean, a number or a string");
  }
  Type t{TypeKind::Literal};
  t.literal = std::move(literal);
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::enum_type(std::vector<std::string> variants, TypeOptions options)
{
  if (variants.empty()) {
    fail("enum must have at least one variant");
  }
  check_names(variants, "enum variant");

  Type t{TypeKind::Enum};
  t.enum_variants = std::move(variants);
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::make_record(
  TypeKind kind, std::vector<Field> fields, Mutability mutability, TypeOptions options)
{
  std::vector<std::string> names;
  names.reserve(fields.size());
  for (const auto & f : fields) {
    require_child(f.type, fmt::format("type of field '{}'", f.name));
    if (kind == TypeKind::Entity && (f.name == "AND" || f.name == "OR" || f.name == "NOT")) {
      fail(fmt::format("entity field name '{}' is reserved", f.name));
    }
    names.push_back(f.name);
  }
  check_names(names, "field");

  Type t{kind};
  t.fields = std::move(fields);
  t.mutability = mutability;
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::object_type(std::vector<Field> fields, TypeOptions options)
{
  return make_record(TypeKind::Object, std::move(fields), Mutability::Immutable, std::move(options));
}

const Type * TypeContext::mutable_object_type(std::vector<Field> fields, TypeOptions options)
{
  return make_record(TypeKind::Object, std::move(fields), Mutability::Mutable, std::move(options));
}

const Type * TypeContext::entity_type(std::vector<Field> fields, TypeOptions options)
{
  return make_record(TypeKind::Entity, std::move(fields), Mutability::Immutable, std::move(options));
}

const Type * TypeContext::mutable_entity_type(std::vector<Field> fields, TypeOptions options)
{
  return make_record(TypeKind::Entity, std::move(fields), Mutability::Mutable, std::move(options));
}

const Type * TypeContext::make_array(
  const Type * item, ArrayOptions array_options, Mutability mutability, TypeOptions options)
{
  require_child(item, "array item type");
  if (array_options.min_items && array_options.max_items &&
      *array_options.min_items > *array_options.max_items) {
    fail(fmt::format(
      "min items {} is greater than max items {}", *array_options.min_items,
      *array_options.max_items));
  }

  Type t{TypeKind::Array};
  t.inner = item;
  t.array_options = array_options;
  t.mutability = mutability;
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::array_type(
  const Type * item, ArrayOptions array_options, TypeOptions options)
{
  return make_array(item, array_options, Mutability::Immutable, std::move(options));
}

const Type * TypeContext::mutable_array_type(
  const Type * item, ArrayOptions array_options, TypeOptions options)
{
  return make_array(item, array_options, Mutability::Mutable, std::move(options));
}

const Type * TypeContext::make_wrapper(TypeKind kind, const Type * inner, TypeOptions options)
{
  require_child(inner, "wrapped type");
  Type t{kind};
  t.inner = inner;
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::optional_type(const Type * inner, TypeOptions options)
{
  return make_wrapper(TypeKind::Optional, inner, std::move(options));
}

const Type * TypeContext::nullable_type(const Type * inner, TypeOptions options)
{
  return make_wrapper(TypeKind::Nullable, inner, std::move(options));
}

const Type * TypeContext::reference_type(const Type * inner, TypeOptions options)
{
  return make_wrapper(TypeKind::Reference, inner, std::move(options));
}

const Type * TypeContext::union_type(std::vector<Variant> variants, TypeOptions options)
{
  if (variants.empty()) {
    fail("union must have at least one variant");
  }
  std::vector<std::string> names;
  names.reserve(variants.size());
  for (const auto & v : variants) {
    require_child(v.type, fmt::format("type of variant '{}'", v.name));
    names.push_back(v.name);
  }
  check_names(names, "variant");

  Type t{TypeKind::Union};
  t.variants = std::move(variants);
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::custom_type(
  std::string name, CustomCodec codec, nlohmann::json custom_options, TypeOptions options)
{
  if (name.empty()) {
    fail("custom type name must not be empty");
  }
  if (!codec.decode || !codec.encode || !codec.validate) {
    fail(fmt::format("custom type '{}' needs decode, encode and validate callbacks", name));
  }

  Type t{TypeKind::Custom};
  t.custom_name = std::move(name);
  t.codec = std::move(codec);
  t.custom_options = std::move(custom_options);
  t.options = std::move(options);
  return intern(std::move(t));
}

const Type * TypeContext::lazy_type(std::function<const Type *()> producer)
{
  if (!producer) {
    fail("lazy type producer must not be empty");
  }
  LazySlot & slot = lazy_slots_.emplace_back();
  slot.producer = std::move(producer);

  Type t{TypeKind::Lazy};
  t.lazy_id = next_lazy_id_++;
  t.slot = &slot;
  return intern(std::move(t));
}

const Type * TypeContext::with_options(const Type * type, TypeOptions options)
{
  require_child(type, "type");
  if (type->is_lazy()) {
    fail("with_options requires a concrete type");
  }
  Type t = *type;
  t.options = std::move(options);
  return intern(std::move(t));
}

}  // namespace typecraft
