// typecraft/types/type_utils.hpp - Type inspection utilities
//
// Shared by the codecs, the arbitrary generator and the retrieve deriver.
//
#pragma once

#include <string>
#include <string_view>

#include "typecraft/types/type.hpp"

namespace typecraft
{

// ============================================================================
// Lazy Resolution
// ============================================================================

/**
 * Resolve lazy indirections until a concrete node is reached.
 *
 * Each lazy node runs its producer at most once; later calls return
 * the cached node, so identity comparisons on the result stay valid.
 *
 * @param type Possibly lazy handle
 * @return Concrete node (never Lazy)
 * @throws std::logic_error if a producer returns null
 */
[[nodiscard]] const Type * concretise(const Type * type);

// ============================================================================
// Structural Equality
// ============================================================================

/**
 * Check if two types have the same structure.
 *
 * Terminates on cyclic types: a pair of nodes met again while already
 * being compared is assumed equal (co-inductive equality).
 * Custom types compare by name and custom options.
 *
 * @param t1 First type
 * @param t2 Second type
 * @return true if both describe the same shape and constraints
 */
[[nodiscard]] bool are_equal(const Type * t1, const Type * t2);

// ============================================================================
// Wrapper Helpers
// ============================================================================

/// Strip Lazy, Optional, Nullable, Reference and Array wrappers
[[nodiscard]] const Type * unwrap(const Type * type);

/// Strip Lazy, Optional, Nullable and Reference wrappers (arrays are kept)
[[nodiscard]] const Type * unwrap_field(const Type * type);

/// Check if the type accepts an absent value
[[nodiscard]] bool is_optional(const Type * type);

/// Check if the type accepts null
[[nodiscard]] bool is_nullable(const Type * type);

/// Check if the unwrapped type is an Entity
[[nodiscard]] bool is_entity(const Type * type);

/// Check if the unwrapped type is a scalar kind
[[nodiscard]] bool is_scalar(const Type * type);

// ============================================================================
// Display
// ============================================================================

/// Lower-case name of a kind, e.g. "entity"
[[nodiscard]] std::string_view kind_name(TypeKind kind) noexcept;

/**
 * Render a type for messages.
 *
 * Named types render as their name; recursive references to a type
 * being rendered print as "...".
 */
[[nodiscard]] std::string to_string(const Type * type);

}  // namespace typecraft
