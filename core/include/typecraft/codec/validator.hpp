// typecraft/codec/validator.hpp - Semantic constraint checking
//
#pragma once

#include "typecraft/basic/value.hpp"
#include "typecraft/codec/errors.hpp"
#include "typecraft/codec/options.hpp"
#include "typecraft/types/type.hpp"

namespace typecraft
{

/**
 * Validate an already decoded value.
 *
 * Only semantic constraints are checked (bounds, lengths, patterns,
 * item counts, custom rules); the value is assumed to be well shaped.
 * Records validate only the fields present in the value, so partial
 * values can be validated.
 *
 * @param type Type the value was decoded with (may be lazy)
 * @param value Decoded value
 * @param options Error reporting policy
 * @return Success or path-tagged validation errors
 * @throws std::logic_error if a union value matches none of its variants
 */
[[nodiscard]] ValidationResult validate(
  const Type * type, const Value & value, const ValidationOptions & options = {});

}  // namespace typecraft
