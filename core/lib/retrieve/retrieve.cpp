// typecraft/retrieve/retrieve.cpp - Retrieve type derivation
//
#include "typecraft/retrieve/retrieve.hpp"

#include <fmt/core.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "typecraft/types/type_utils.hpp"

namespace typecraft
{

namespace
{

TypeOptions named(const Type * entity, std::string_view suffix)
{
  TypeOptions options;
  options.name = fmt::format("{}{}", entity->options.name.value_or("Anonymous"), suffix);
  return options;
}

/**
 * Builds the retrieve types of one derivation.
 *
 * Every per-entity (and per-object) type is built once. While a type is
 * being built its cache entry is a lazy node, so a cycle back to it
 * refers to the lazy node instead of recursing. Errors are recorded and
 * stop the walk; partially built nodes are left unused in the context.
 */
class RetrieveDeriver
{
public:
  RetrieveDeriver(TypeContext & ctx, size_t max_take) : ctx_(ctx), max_take_(max_take) {}

  const Type * retrieve(const Type * entity, const Capabilities & capabilities);

  [[nodiscard]] const std::optional<std::string> & error() const noexcept { return error_; }

private:
  using Cache = std::unordered_map<const Type *, const Type *>;

  template <typename Build>
  const Type * memoised(Cache & cache, const Type * key, Build && build);

  // Where
  const Type * entity_where(const Type * entity);
  const Type * where_field(const Type * type);
  const Type * scalar_where(const Type * scalar);

  // Select
  const Type * entity_select(const Type * entity);
  const Type * select_field(const Type * type);
  const Type * relation_select(const Type * entity);
  const Type * to_many_select(const Type * entity);
  const Type * object_select(const Type * object);

  // OrderBy
  const Type * entity_order_by(const Type * entity);
  const Type * order_by_field(const Type * type);
  const Type * object_order_by(const Type * object);
  const Type * sort_direction();

  const Type * boolean();

  void fail(std::string message)
  {
    if (!error_) {
      error_ = std::move(message);
    }
  }

  TypeContext & ctx_;
  size_t max_take_;

  Cache wheres_;
  Cache selects_;
  Cache relation_selects_;
  Cache to_many_selects_;
  Cache object_selects_;
  Cache order_bys_;
  Cache object_order_bys_;

  const Type * sort_direction_ = nullptr;
  const Type * count_order_by_ = nullptr;
  const Type * boolean_ = nullptr;

  std::optional<std::string> error_;
};

template <typename Build>
const Type * RetrieveDeriver::memoised(Cache & cache, const Type * key, Build && build)
{
  if (const auto it = cache.find(key); it != cache.end()) {
    return it->second;
  }

  auto slot = std::make_shared<const Type *>(nullptr);
  cache.emplace(key, ctx_.lazy_type([slot] { return *slot; }));

  const Type * built = build();
  if (built == nullptr) {
    return nullptr;
  }
  *slot = built;
  cache[key] = built;
  return built;
}

const Type * RetrieveDeriver::boolean()
{
  if (boolean_ == nullptr) {
    boolean_ = ctx_.boolean_type();
  }
  return boolean_;
}

// ============================================================================
// Retrieve Object
// ============================================================================

const Type * RetrieveDeriver::retrieve(const Type * entity, const Capabilities & capabilities)
{
  std::vector<Field> fields;

  if (capabilities.where) {
    const Type * where = entity_where(entity);
    if (where == nullptr) {
      return nullptr;
    }
    fields.push_back({"where", ctx_.optional_type(where)});
  }
  if (capabilities.select) {
    const Type * select = entity_select(entity);
    if (select == nullptr) {
      return nullptr;
    }
    fields.push_back({"select", ctx_.optional_type(select)});
  }
  if (capabilities.order_by) {
    const Type * order_by = entity_order_by(entity);
    if (order_by == nullptr) {
      return nullptr;
    }
    fields.push_back({"orderBy", ctx_.optional_type(ctx_.array_type(order_by))});
  }
  if (capabilities.skip) {
    NumberOptions skip;
    skip.minimum = 0.0;
    fields.push_back({"skip", ctx_.optional_type(ctx_.integer_type(skip))});
  }
  if (capabilities.take) {
    NumberOptions take;
    take.minimum = 0.0;
    take.maximum = static_cast<double>(capabilities.max_take);
    fields.push_back({"take", ctx_.optional_type(ctx_.integer_type(take))});
  }
  return ctx_.object_type(std::move(fields));
}

// ============================================================================
// Where
// ============================================================================

const Type * RetrieveDeriver::entity_where(const Type * entity)
{
  return memoised(wheres_, entity, [&]() -> const Type * {
    std::vector<Field> fields;
    for (const auto & field : entity->fields) {
      const Type * where = where_field(field.type);
      if (error_) {
        return nullptr;
      }
      if (where != nullptr) {
        fields.push_back({field.name, ctx_.optional_type(where)});
      }
    }

    const Type * self = entity_where(entity);
    const Type * list = ctx_.array_type(self);
    fields.push_back({"AND", ctx_.optional_type(list)});
    fields.push_back({"OR", ctx_.optional_type(list)});
    fields.push_back({"NOT", ctx_.optional_type(self)});
    return ctx_.object_type(std::move(fields), named(entity, "Where"));
  });
}

/// Filter of one field, nullptr when the field cannot be filtered on
const Type * RetrieveDeriver::where_field(const Type * type)
{
  const Type * t = unwrap_field(type);
  switch (t->kind) {
    case TypeKind::Array: {
      const Type * item = unwrap_field(t->inner);
      if (item->kind == TypeKind::Array) {
        fail(fmt::format("array of arrays is not supported in where: {}", to_string(type)));
        return nullptr;
      }
      if (item->kind == TypeKind::Entity) {
        const Type * where = entity_where(item);
        if (where == nullptr) {
          return nullptr;
        }
        return ctx_.object_type({
          {"some", ctx_.optional_type(where)},
          {"every", ctx_.optional_type(where)},
          {"none", ctx_.optional_type(where)},
        });
      }
      if (item->is_scalar()) {
        return ctx_.object_type({{"equals", ctx_.optional_type(ctx_.array_type(item))}});
      }
      return nullptr;
    }
    case TypeKind::Entity:
      return entity_where(t);
    case TypeKind::Object:
    case TypeKind::Union:
      return nullptr;
    case TypeKind::String:
    case TypeKind::Number:
    case TypeKind::Boolean:
    case TypeKind::Literal:
    case TypeKind::Enum:
    case TypeKind::Custom:
      return scalar_where(t);
    case TypeKind::Optional:
    case TypeKind::Nullable:
    case TypeKind::Reference:
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected wrapper after unwrap_field");
}

const Type * RetrieveDeriver::scalar_where(const Type * scalar)
{
  std::vector<Field> fields{{"equals", ctx_.optional_type(scalar)}};
  if (scalar->kind == TypeKind::Number) {
    for (const char * comparison : {"lt", "lte", "gt", "gte"}) {
      fields.push_back({comparison, ctx_.optional_type(scalar)});
    }
  }
  if (scalar->kind != TypeKind::Boolean) {
    fields.push_back({"in", ctx_.optional_type(ctx_.array_type(scalar))});
  }
  return ctx_.object_type(std::move(fields));
}

// ============================================================================
// Select
// ============================================================================

const Type * RetrieveDeriver::entity_select(const Type * entity)
{
  return memoised(selects_, entity, [&]() -> const Type * {
    std::vector<Field> fields;
    for (const auto & field : entity->fields) {
      const Type * select = select_field(field.type);
      if (select == nullptr) {
        return nullptr;
      }
      fields.push_back({field.name, ctx_.optional_type(select)});
    }
    return ctx_.object_type(std::move(fields), named(entity, "Select"));
  });
}

const Type * RetrieveDeriver::select_field(const Type * type)
{
  const Type * t = unwrap_field(type);
  switch (t->kind) {
    case TypeKind::Array: {
      const Type * item = unwrap_field(t->inner);
      if (item->kind == TypeKind::Array) {
        fail(fmt::format("array of arrays is not supported in select: {}", to_string(type)));
        return nullptr;
      }
      if (item->kind == TypeKind::Entity) {
        return to_many_select(item);
      }
      return select_field(item);
    }
    case TypeKind::Entity:
      return relation_select(t);
    case TypeKind::Object:
      return object_select(t);
    case TypeKind::String:
    case TypeKind::Number:
    case TypeKind::Boolean:
    case TypeKind::Literal:
    case TypeKind::Enum:
    case TypeKind::Custom:
    case TypeKind::Union:
      return boolean();
    case TypeKind::Optional:
    case TypeKind::Nullable:
    case TypeKind::Reference:
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected wrapper after unwrap_field");
}

/// `{retrieve: {select?}} | {all: boolean}`
const Type * RetrieveDeriver::relation_select(const Type * entity)
{
  return memoised(relation_selects_, entity, [&]() -> const Type * {
    const Type * select = entity_select(entity);
    if (select == nullptr) {
      return nullptr;
    }
    const Type * partial = ctx_.object_type({{"select", ctx_.optional_type(select)}});
    return ctx_.union_type({{"retrieve", partial}, {"all", boolean()}});
  });
}

/// `{retrieve: <full retrieve>} | {all: boolean}`
const Type * RetrieveDeriver::to_many_select(const Type * entity)
{
  return memoised(to_many_selects_, entity, [&]() -> const Type * {
    const Type * full = retrieve(entity, Capabilities::all(max_take_));
    if (full == nullptr) {
      return nullptr;
    }
    return ctx_.union_type({{"retrieve", full}, {"all", boolean()}});
  });
}

/// `{fields: {select: {...}}} | {all: boolean}`
const Type * RetrieveDeriver::object_select(const Type * object)
{
  return memoised(object_selects_, object, [&]() -> const Type * {
    std::vector<Field> fields;
    for (const auto & field : object->fields) {
      const Type * select = select_field(field.type);
      if (select == nullptr) {
        return nullptr;
      }
      fields.push_back({field.name, ctx_.optional_type(select)});
    }
    const Type * selection = ctx_.object_type({{"select", ctx_.object_type(std::move(fields))}});
    return ctx_.union_type({{"fields", selection}, {"all", boolean()}});
  });
}

// ============================================================================
// OrderBy
// ============================================================================

const Type * RetrieveDeriver::sort_direction()
{
  if (sort_direction_ == nullptr) {
    TypeOptions options;
    options.name = "SortDirection";
    sort_direction_ = ctx_.union_type(
      {{"asc", ctx_.literal_type(Value::make_string("asc"))},
       {"desc", ctx_.literal_type(Value::make_string("desc"))}},
      std::move(options));
  }
  return sort_direction_;
}

const Type * RetrieveDeriver::entity_order_by(const Type * entity)
{
  return memoised(order_bys_, entity, [&]() -> const Type * {
    std::vector<Field> fields;
    for (const auto & field : entity->fields) {
      const Type * order_by = order_by_field(field.type);
      if (error_) {
        return nullptr;
      }
      if (order_by != nullptr) {
        fields.push_back({field.name, ctx_.optional_type(order_by)});
      }
    }
    return ctx_.object_type(std::move(fields), named(entity, "OrderBy"));
  });
}

/// Ordering of one field, nullptr when the field cannot be ordered by
const Type * RetrieveDeriver::order_by_field(const Type * type)
{
  const Type * t = unwrap_field(type);
  switch (t->kind) {
    case TypeKind::Array:
      if (unwrap_field(t->inner)->kind == TypeKind::Array) {
        fail(fmt::format("array of arrays is not supported in orderBy: {}", to_string(type)));
        return nullptr;
      }
      if (count_order_by_ == nullptr) {
        count_order_by_ = ctx_.object_type({{"_count", ctx_.optional_type(sort_direction())}});
      }
      return count_order_by_;
    case TypeKind::Entity:
      return entity_order_by(t);
    case TypeKind::Object:
      return object_order_by(t);
    case TypeKind::Union:
      return nullptr;
    case TypeKind::String:
    case TypeKind::Number:
    case TypeKind::Boolean:
    case TypeKind::Literal:
    case TypeKind::Enum:
    case TypeKind::Custom:
      return sort_direction();
    case TypeKind::Optional:
    case TypeKind::Nullable:
    case TypeKind::Reference:
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected wrapper after unwrap_field");
}

const Type * RetrieveDeriver::object_order_by(const Type * object)
{
  return memoised(object_order_bys_, object, [&]() -> const Type * {
    std::vector<Field> fields;
    for (const auto & field : object->fields) {
      const Type * order_by = order_by_field(field.type);
      if (error_) {
        return nullptr;
      }
      if (order_by != nullptr) {
        fields.push_back({field.name, ctx_.optional_type(order_by)});
      }
    }
    return ctx_.object_type(std::move(fields));
  });
}

}  // namespace

Result<const Type *, std::string> derive_retrieve_type(
  TypeContext & ctx, const Type * type, const Capabilities & capabilities)
{
  using DeriveResult = Result<const Type *, std::string>;

  if (!capabilities.any()) {
    return DeriveResult::fail("no retrieve capability requested");
  }
  const Type * entity = unwrap(type);
  if (entity->kind != TypeKind::Entity) {
    return DeriveResult::fail(
      fmt::format("cannot derive a retrieve type from {}: not an entity", to_string(type)));
  }

  RetrieveDeriver deriver(ctx, capabilities.max_take);
  const Type * derived = deriver.retrieve(entity, capabilities);
  if (deriver.error()) {
    return DeriveResult::fail(*deriver.error());
  }
  return DeriveResult::ok(derived);
}

}  // namespace typecraft
