// typecraft/retrieve/selection.cpp - Selected types, selection depth and merging
//
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include "typecraft/codec/decoder.hpp"
#include "typecraft/retrieve/retrieve.hpp"
#include "typecraft/types/type_utils.hpp"

namespace typecraft
{

namespace
{

bool is_missing(const Value * value)
{
  return value == nullptr || value->is_undefined() || value->is_null();
}

/// Unselected: absent or `false`
bool is_unselected(const Value * value)
{
  return is_missing(value) || (value->is_bool() && !value->as_bool());
}

bool is_true(const Value * value) { return value != nullptr && value->is_bool() && value->as_bool(); }

/// `{select: {field: true}}` for every field of `entity`, relations included
Value select_all_fields(const Type * entity)
{
  Value select = Value::make_object();
  for (const auto & field : entity->fields) {
    select.set(field.name, Value::make_bool(true));
  }
  Value retrieve = Value::make_object();
  retrieve.set("select", std::move(select));
  return retrieve;
}

/// Union of two selections of a plain object; `true` wins over a partial selection
Value merge_object_selects(const Value & left, const Value & right)
{
  if (is_unselected(&left)) {
    return right;
  }
  if (is_unselected(&right)) {
    return left;
  }
  if (left.is_object() && right.is_object()) {
    Value merged = left;
    for (const auto & [key, value] : right.fields()) {
      merged.set(key, merge_object_selects(left.get(key), value));
    }
    return merged;
  }
  if ((left.is_bool() && left.as_bool()) || (right.is_bool() && right.as_bool())) {
    return Value::make_bool(true);
  }
  return left;
}

Value merge_select(
  const Type * type, const Value * left, const Value * right, const MergeOptions & options)
{
  if (is_missing(left)) {
    return right == nullptr ? Value{} : *right;
  }
  if (is_missing(right)) {
    return *left;
  }

  const Type * t = concretise(type);
  if (t->is_wrapper()) {
    return merge_select(t->inner, left, right, options);
  }
  if (t->kind != TypeKind::Entity) {
    return *left;
  }

  Value merged = Value::make_object();
  for (const auto & field : t->fields) {
    const Value * l = left->find(field.name);
    const Value * r = right->find(field.name);
    if (is_unselected(l)) {
      if (r != nullptr) {
        merged.set(field.name, *r);
      }
      continue;
    }
    if (is_unselected(r)) {
      merged.set(field.name, *l);
      continue;
    }

    const Type * related = unwrap(field.type);
    if (related->kind == TypeKind::Entity) {
      if (is_true(l) && is_true(r)) {
        merged.set(field.name, Value::make_bool(true));
      } else if (is_true(l)) {
        merged.set(field.name, merge_retrieve(related, select_all_fields(related), *r, options));
      } else if (is_true(r)) {
        merged.set(field.name, merge_retrieve(related, *l, select_all_fields(related), options));
      } else {
        merged.set(field.name, merge_retrieve(related, *l, *r, options));
      }
    } else if (is_true(l) || is_true(r)) {
      merged.set(field.name, Value::make_bool(true));
    } else {
      Value nested = Value::make_object();
      nested.set("select", merge_object_selects(l->get("select"), r->get("select")));
      merged.set(field.name, std::move(nested));
    }
  }
  return merged;
}

/// orderBy as a list: an array as is, a single entry as a one element list
std::vector<Value> order_by_entries(const Value & retrieve)
{
  const Value * order_by = retrieve.find("orderBy");
  if (is_missing(order_by)) {
    return {};
  }
  if (order_by->is_array()) {
    const auto items = order_by->as_array();
    return std::vector<Value>(items.begin(), items.end());
  }
  return {*order_by};
}

/// First present of `first` and `second`
const Value * first_present(const Value * first, const Value * second)
{
  return is_missing(first) ? second : first;
}

}  // namespace

// ============================================================================
// Selected Type
// ============================================================================

const Type * selected_type(TypeContext & ctx, const Type * type, const Value & select)
{
  if (select.is_undefined() || select.is_null()) {
    return type;
  }

  const Type * t = concretise(type);
  switch (t->kind) {
    case TypeKind::Optional:
      return ctx.optional_type(selected_type(ctx, t->inner, select));
    case TypeKind::Nullable:
      return ctx.nullable_type(selected_type(ctx, t->inner, select));
    case TypeKind::Array:
      return ctx.array_type(selected_type(ctx, t->inner, select));
    case TypeKind::Reference:
      return ctx.reference_type(selected_type(ctx, t->inner, select));
    case TypeKind::Object:
    case TypeKind::Entity: {
      std::vector<Field> fields;
      for (const auto & field : t->fields) {
        const Value * selection = select.find(field.name);
        if (is_true(selection)) {
          fields.push_back(field);
        } else if (selection != nullptr && selection->is_object()) {
          const Value * nested = selection->find("select");
          if (nested != nullptr && nested->is_object()) {
            fields.push_back({field.name, selected_type(ctx, field.type, *nested)});
          }
        }
      }
      return ctx.object_type(std::move(fields));
    }
    case TypeKind::String:
    case TypeKind::Number:
    case TypeKind::Boolean:
    case TypeKind::Literal:
    case TypeKind::Enum:
    case TypeKind::Union:
    case TypeKind::Custom:
      return t;
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected lazy type after concretise");
}

DecodeResult is_respected(
  TypeContext & ctx, const Type * type, const Value & retrieve, const Value & value)
{
  const Type * target = type;
  if (const Value * select = retrieve.find("select")) {
    target = selected_type(ctx, type, *select);
  }

  // The value is already typed: unions hold bare variant values
  detail::DecoderState state;
  state.options.field_strictness = FieldStrictness::AllowAdditionalFields;
  state.bare_unions = true;
  return detail::decode_node(target, value, state);
}

// ============================================================================
// Selection Depth
// ============================================================================

int selection_depth(const Type * type, const Value & retrieve)
{
  const Type * t = concretise(type);
  if (t->is_wrapper()) {
    return selection_depth(t->inner, retrieve);
  }
  if (t->kind != TypeKind::Entity) {
    return 1;
  }

  const Value * select = retrieve.find("select");
  if (select == nullptr || !select->is_object()) {
    return 1;
  }

  int depth = 1;
  for (const auto & field : t->fields) {
    const Value * selection = select->find(field.name);
    if (selection == nullptr || !is_entity(field.type)) {
      continue;
    }
    if (selection->is_object()) {
      depth = std::max(depth, 1 + selection_depth(field.type, *selection));
    }
  }
  return depth;
}

// ============================================================================
// Merge
// ============================================================================

Value merge_retrieve(
  const Type * type, const Value & left, const Value & right, const MergeOptions & options)
{
  if (left.is_undefined()) {
    return right;
  }
  if (right.is_undefined()) {
    return left;
  }

  Value merged = Value::make_object();

  const Value * left_where = left.find("where");
  const Value * right_where = right.find("where");
  if (!is_missing(left_where) && !is_missing(right_where)) {
    Value conjunction = Value::make_object();
    conjunction.set("AND", Value::make_array({*left_where, *right_where}));
    merged.set("where", std::move(conjunction));
  } else if (const Value * where = first_present(left_where, right_where); !is_missing(where)) {
    merged.set("where", *where);
  }

  const Value * left_select = left.find("select");
  const Value * right_select = right.find("select");
  if (Value select = merge_select(type, left_select, right_select, options); !select.is_undefined()) {
    merged.set("select", std::move(select));
  }

  std::vector<Value> first_order = order_by_entries(left);
  std::vector<Value> second_order = order_by_entries(right);
  if (options.order_by_order == MergeOrder::RightBefore) {
    std::swap(first_order, second_order);
  }
  first_order.insert(first_order.end(), second_order.begin(), second_order.end());
  if (!first_order.empty()) {
    merged.set("orderBy", Value::make_array(std::move(first_order)));
  }

  const auto pick = [&](const char * key, MergeOrder order) {
    const Value * l = left.find(key);
    const Value * r = right.find(key);
    const Value * chosen = order == MergeOrder::LeftBefore ? first_present(l, r) : first_present(r, l);
    if (!is_missing(chosen)) {
      merged.set(key, *chosen);
    }
  };
  pick("skip", options.skip_order);
  pick("take", options.take_order);

  return merged;
}

}  // namespace typecraft
