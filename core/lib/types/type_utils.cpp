// typecraft/types/type_utils.cpp - Type inspection utilities
//
#include "typecraft/types/type_utils.hpp"

#include <fmt/core.h>

#include <set>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace typecraft
{

// ============================================================================
// Lazy Resolution
// ============================================================================

const Type * concretise(const Type * type)
{
  if (type == nullptr) {
    throw std::logic_error("cannot concretise a null type");
  }
  while (type->is_lazy()) {
    LazySlot * slot = type->slot;
    std::call_once(slot->once, [slot]() { slot->resolved = slot->producer(); });
    if (slot->resolved == nullptr) {
      throw std::logic_error(fmt::format("lazy type #{} produced a null type", type->lazy_id));
    }
    type = slot->resolved;
  }
  return type;
}

// ============================================================================
// Structural Equality
// ============================================================================

namespace
{

using TypePair = std::pair<const Type *, const Type *>;

bool options_equal(const TypeOptions & a, const TypeOptions & b)
{
  return a.name == b.name && a.description == b.description && a.sensitive == b.sensitive;
}

bool equal_impl(const Type * t1, const Type * t2, std::set<TypePair> & assumed)
{
  const Type * a = concretise(t1);
  const Type * b = concretise(t2);
  if (a == b) {
    return true;
  }
  // Co-inductive step: a recurring pair is assumed equal
  if (!assumed.insert({a, b}).second) {
    return true;
  }
  if (a->kind != b->kind || !options_equal(a->options, b->options)) {
    return false;
  }

  switch (a->kind) {
    case TypeKind::String:
      return a->string_options.min_length == b->string_options.min_length &&
             a->string_options.max_length == b->string_options.max_length &&
             a->string_options.regex == b->string_options.regex;
    case TypeKind::Number:
      return a->is_integer == b->is_integer &&
             a->number_options.minimum == b->number_options.minimum &&
             a->number_options.maximum == b->number_options.maximum &&
             a->number_options.exclusive_minimum == b->number_options.exclusive_minimum &&
             a->number_options.exclusive_maximum == b->number_options.exclusive_maximum;
    case TypeKind::Boolean:
      return true;
    case TypeKind::Literal:
      return a->literal == b->literal;
    case TypeKind::Enum:
      return a->enum_variants == b->enum_variants;
    case TypeKind::Object:
    case TypeKind::Entity:
      if (a->mutability != b->mutability || a->fields.size() != b->fields.size()) {
        return false;
      }
      for (size_t i = 0; i < a->fields.size(); ++i) {
        if (a->fields[i].name != b->fields[i].name ||
            !equal_impl(a->fields[i].type, b->fields[i].type, assumed)) {
          return false;
        }
      }
      return true;
    case TypeKind::Array:
      return a->mutability == b->mutability &&
             a->array_options.min_items == b->array_options.min_items &&
             a->array_options.max_items == b->array_options.max_items &&
             equal_impl(a->inner, b->inner, assumed);
    case TypeKind::Optional:
    case TypeKind::Nullable:
    case TypeKind::Reference:
      return equal_impl(a->inner, b->inner, assumed);
    case TypeKind::Union:
      if (a->variants.size() != b->variants.size()) {
        return false;
      }
      for (size_t i = 0; i < a->variants.size(); ++i) {
        if (a->variants[i].name != b->variants[i].name ||
            !equal_impl(a->variants[i].type, b->variants[i].type, assumed)) {
          return false;
        }
      }
      return true;
    case TypeKind::Custom:
      return a->custom_name == b->custom_name && a->custom_options == b->custom_options;
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected lazy type after concretise");
}

}  // namespace

bool are_equal(const Type * t1, const Type * t2)
{
  std::set<TypePair> assumed;
  return equal_impl(t1, t2, assumed);
}

// ============================================================================
// Wrapper Helpers
// ============================================================================

const Type * unwrap(const Type * type)
{
  const Type * t = concretise(type);
  while (t->is_wrapper()) {
    t = concretise(t->inner);
  }
  return t;
}

const Type * unwrap_field(const Type * type)
{
  const Type * t = concretise(type);
  while (t->kind == TypeKind::Optional || t->kind == TypeKind::Nullable ||
         t->kind == TypeKind::Reference) {
    t = concretise(t->inner);
  }
  return t;
}

bool is_optional(const Type * type)
{
  const Type * t = concretise(type);
  while (t->kind == TypeKind::Reference) {
    t = concretise(t->inner);
  }
  return t->kind == TypeKind::Optional;
}

bool is_nullable(const Type * type)
{
  const Type * t = concretise(type);
  while (t->kind == TypeKind::Reference || t->kind == TypeKind::Optional) {
    t = concretise(t->inner);
  }
  return t->kind == TypeKind::Nullable;
}

bool is_entity(const Type * type) { return unwrap(type)->kind == TypeKind::Entity; }

bool is_scalar(const Type * type) { return unwrap(type)->is_scalar(); }

// ============================================================================
// Display
// ============================================================================

std::string_view kind_name(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::String:
      return "string";
    case TypeKind::Number:
      return "number";
    case TypeKind::Boolean:
      return "boolean";
    case TypeKind::Literal:
      return "literal";
    case TypeKind::Enum:
      return "enum";
    case TypeKind::Object:
      return "object";
    case TypeKind::Entity:
      return "entity";
    case TypeKind::Array:
      return "array";
    case TypeKind::Optional:
      return "optional";
    case TypeKind::Nullable:
      return "nullable";
    case TypeKind::Reference:
      return "reference";
    case TypeKind::Union:
      return "union";
    case TypeKind::Custom:
      return "custom";
    case TypeKind::Lazy:
      return "lazy";
  }
  return "unknown";
}

namespace
{

std::string render(const Type * type, std::unordered_set<const Type *> & visiting)
{
  const Type * t = concretise(type);
  if (t->options.name) {
    return *t->options.name;
  }
  if (!visiting.insert(t).second) {
    return "...";
  }

  std::string out;
  switch (t->kind) {
    case TypeKind::String:
    case TypeKind::Boolean:
      out = std::string(kind_name(t->kind));
      break;
    case TypeKind::Number:
      out = t->is_integer ? "integer" : "number";
      break;
    case TypeKind::Literal:
      out = fmt::format("literal ({})", t->literal.to_string());
      break;
    case TypeKind::Enum: {
      std::string variants;
      for (const auto & v : t->enum_variants) {
        variants += variants.empty() ? "" : " | ";
        variants += fmt::format("\"{}\"", v);
      }
      out = fmt::format("enum ({})", variants);
      break;
    }
    case TypeKind::Object:
    case TypeKind::Entity: {
      std::string fields;
      for (const auto & f : t->fields) {
        fields += fields.empty() ? "" : ", ";
        fields += fmt::format("{}: {}", f.name, render(f.type, visiting));
      }
      out = fmt::format("{} {{ {} }}", kind_name(t->kind), fields);
      break;
    }
    case TypeKind::Array:
    case TypeKind::Optional:
    case TypeKind::Nullable:
    case TypeKind::Reference:
      out = fmt::format("{}<{}>", kind_name(t->kind), render(t->inner, visiting));
      break;
    case TypeKind::Union: {
      std::string variants;
      for (const auto & v : t->variants) {
        variants += variants.empty() ? "" : " | ";
        variants += fmt::format("{}: {}", v.name, render(v.type, visiting));
      }
      out = fmt::format("union ({})", variants);
      break;
    }
    case TypeKind::Custom:
      out = t->custom_name;
      break;
    case TypeKind::Lazy:
      throw std::logic_error("unexpected lazy type after concretise");
  }

  visiting.erase(t);
  return out;
}

}  // namespace

std::string to_string(const Type * type)
{
  std::unordered_set<const Type *> visiting;
  return render(type, visiting);
}

}  // namespace typecraft
