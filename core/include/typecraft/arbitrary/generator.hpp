// typecraft/arbitrary/generator.hpp - Seeded random value generation
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <unordered_map>
#include <vector>

#include "typecraft/arbitrary/regex_sampler.hpp"
#include "typecraft/basic/value.hpp"
#include "typecraft/types/type.hpp"

namespace typecraft
{

/**
 * Restartable generator of values satisfying a type's constraints.
 *
 * The same seed always yields the same sequence. Recursion is bounded
 * by `max_depth`: each record, array or union level consumes one unit, and at
 * depth 0 arrays are empty (unless min_items forces items), optionals
 * are absent, nullables are null and unions pick a variant that can
 * terminate.
 */
class ValueGenerator
{
public:
  /**
   * @param type Type to generate (may be lazy)
   * @param seed Seed of the random sequence
   * @param max_depth Recursion budget
   */
  ValueGenerator(const Type * type, uint64_t seed, int max_depth = 3);

  /**
   * Next value of the sequence.
   *
   * @throws std::logic_error if the type cannot be generated (a regex
   *         combined with length bounds, a custom type without generator,
   *         a record that requires itself)
   */
  [[nodiscard]] Value next();

  /// Next `count` values
  [[nodiscard]] std::vector<Value> take(size_t count);

  /// Restart the sequence from the seed
  void reset();

  [[nodiscard]] uint64_t seed() const noexcept { return seed_; }
  [[nodiscard]] int max_depth() const noexcept { return max_depth_; }

private:
  Value generate(const Type * type, int depth);
  Value generate_string(const Type * type);
  Value generate_number(const Type * type);
  Value generate_array(const Type * type, int depth);
  Value generate_record(const Type * type, int depth);
  Value generate_union(const Type * type, int depth);

  bool coin();
  size_t height(const Type * type);

  const Type * type_;
  uint64_t seed_;
  int max_depth_;
  std::mt19937_64 engine_;
  std::unordered_map<const Type *, std::shared_ptr<const RegexSampler>> samplers_;
  std::unordered_map<const Type *, size_t> heights_;
};

/// Generator for `type` (see ValueGenerator)
[[nodiscard]] ValueGenerator arbitrary(const Type * type, uint64_t seed, int max_depth = 3);

}  // namespace typecraft
