// typecraft/retrieve/retrieve.hpp - Retrieve shape derivation and merging
//
// A retrieve describes what to read from an entity: which fields
// (select), which instances (where), in which order (orderBy) and
// which page (skip, take). Retrieve values are decoded values of the
// derived type, so union selections hold their bare variant value:
// `true` selects a field, `{select: {...}}` selects a relation or
// object partially.
//
#pragma once

#include <cstddef>
#include <string>

#include "typecraft/basic/result.hpp"
#include "typecraft/basic/value.hpp"
#include "typecraft/codec/errors.hpp"
#include "typecraft/types/type.hpp"

namespace typecraft
{

// ============================================================================
// Capabilities
// ============================================================================

/**
 * Top-level fields of a derived retrieve type.
 */
struct Capabilities
{
  bool where = false;
  bool select = false;
  bool order_by = false;
  bool take = false;
  bool skip = false;

  /// Upper bound of `take`
  size_t max_take = 20;

  static Capabilities all(size_t max_take = 20)
  {
    return Capabilities{true, true, true, true, true, max_take};
  }

  [[nodiscard]] bool any() const noexcept { return where || select || order_by || take || skip; }
};

// ============================================================================
// Derivation
// ============================================================================

/**
 * Derive the retrieve type of an entity.
 *
 * Optional, nullable, reference and array wrappers around the entity
 * are stripped. Nested types are named after the entity (`UserWhere`,
 * `UserSelect`, `UserOrderBy`) and built once per entity; cycles
 * between entities go through lazy nodes.
 *
 * @param ctx Context owning the derived nodes
 * @param type Entity type (may be wrapped or lazy)
 * @param capabilities Fields of the derived object
 * @return Retrieve object type, or a message when no capability is
 *         requested, the type is not an entity or a field holds an
 *         array of arrays
 */
[[nodiscard]] Result<const Type *, std::string> derive_retrieve_type(
  TypeContext & ctx, const Type * type, const Capabilities & capabilities);

// ============================================================================
// Selection
// ============================================================================

/**
 * Type of the values a selection yields.
 *
 * Records keep the fields selected with `true` and recurse into
 * fields selected with `{select: ...}`; other fields are dropped.
 * Optional, nullable and array wrappers are kept.
 *
 * @param select Select value; Undefined returns `type` unchanged
 */
[[nodiscard]] const Type * selected_type(TypeContext & ctx, const Type * type, const Value & select);

/**
 * Check that a value holds no more than a retrieve selects.
 *
 * The value is decoded against the selected type with additional
 * fields allowed, which trims unselected fields.
 *
 * @return Trimmed value or decoding errors
 */
[[nodiscard]] DecodeResult is_respected(
  TypeContext & ctx, const Type * type, const Value & retrieve, const Value & value);

/**
 * Depth of the selection, counted through entity relations.
 *
 * A retrieve without select, or a non-entity type, has depth 1. Only a
 * relation selected with an object (`{select: ...}`) counts as one more
 * level; `true` does not.
 */
[[nodiscard]] int selection_depth(const Type * type, const Value & retrieve);

// ============================================================================
// Merging
// ============================================================================

enum class MergeOrder {
  LeftBefore,
  RightBefore,
};

struct MergeOptions
{
  MergeOrder order_by_order = MergeOrder::LeftBefore;
  MergeOrder skip_order = MergeOrder::LeftBefore;
  MergeOrder take_order = MergeOrder::LeftBefore;

  /// Same order for orderBy, skip and take
  static MergeOptions with_order(MergeOrder order) { return MergeOptions{order, order, order}; }
};

/**
 * Merge two retrieve values of the same entity.
 *
 * - where: `{AND: [left, right]}`, or the only one present
 * - orderBy: concatenation, in `order_by_order`
 * - skip/take: the first present side, in `skip_order`/`take_order`
 * - select: union of both selections; a relation selected with `true`
 *   on one side expands to every one of its fields, relations included,
 *   before merging. `false` and null count as unselected at every level
 *
 * An Undefined side returns the other one unchanged.
 */
[[nodiscard]] Value merge_retrieve(
  const Type * type, const Value & left, const Value & right, const MergeOptions & options = {});

}  // namespace typecraft
