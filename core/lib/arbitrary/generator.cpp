// typecraft/arbitrary/generator.cpp - Per-kind value generation
//
#include "typecraft/arbitrary/generator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <regex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "typecraft/types/type_utils.hpp"

namespace typecraft
{

namespace
{

constexpr std::string_view k_alphabet =
  "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

/// Default width of a number range with a missing bound
constexpr double k_default_span = 1000.0;

/// Attempts at sampling a regex before giving up
constexpr int k_regex_attempts = 64;

/// Height of a type whose generation cannot terminate
constexpr size_t k_unbounded = std::numeric_limits<size_t>::max();

/**
 * Minimal nesting needed to generate a value of `type`.
 *
 * A record met again while computing its own height needs itself, so
 * it is unbounded along that path.
 */
size_t height_impl(const Type * type, std::unordered_set<const Type *> & visiting)
{
  const Type * t = concretise(type);
  switch (t->kind) {
    case TypeKind::String:
    case TypeKind::Number:
    case TypeKind::Boolean:
    case TypeKind::Literal:
    case TypeKind::Enum:
    case TypeKind::Custom:
    case TypeKind::Optional:
    case TypeKind::Nullable:
      return 0;
    case TypeKind::Array: {
      if (t->array_options.min_items.value_or(0) == 0) {
        return 0;
      }
      const size_t item = height_impl(t->inner, visiting);
      return item == k_unbounded ? k_unbounded : item + 1;
    }
    case TypeKind::Reference:
      return height_impl(t->inner, visiting);
    case TypeKind::Object:
    case TypeKind::Entity: {
      if (!visiting.insert(t).second) {
        return k_unbounded;
      }
      size_t deepest = 0;
      for (const auto & f : t->fields) {
        deepest = std::max(deepest, height_impl(f.type, visiting));
        if (deepest == k_unbounded) {
          break;
        }
      }
      visiting.erase(t);
      return deepest == k_unbounded ? k_unbounded : deepest + 1;
    }
    case TypeKind::Union: {
      if (!visiting.insert(t).second) {
        return k_unbounded;
      }
      size_t lowest = k_unbounded;
      for (const auto & v : t->variants) {
        lowest = std::min(lowest, height_impl(v.type, visiting));
      }
      visiting.erase(t);
      return lowest;
    }
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected lazy type after concretise");
}

}  // namespace

ValueGenerator::ValueGenerator(const Type * type, uint64_t seed, int max_depth)
: type_(type), seed_(seed), max_depth_(max_depth), engine_(seed)
{
}

Value ValueGenerator::next() { return generate(type_, max_depth_); }

std::vector<Value> ValueGenerator::take(size_t count)
{
  std::vector<Value> values;
  values.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    values.push_back(next());
  }
  return values;
}

void ValueGenerator::reset() { engine_.seed(seed_); }

bool ValueGenerator::coin() { return std::bernoulli_distribution(0.5)(engine_); }

size_t ValueGenerator::height(const Type * type)
{
  const Type * t = concretise(type);
  if (const auto it = heights_.find(t); it != heights_.end()) {
    return it->second;
  }
  std::unordered_set<const Type *> visiting;
  const size_t h = height_impl(t, visiting);
  heights_.emplace(t, h);
  return h;
}

// ============================================================================
// Dispatch
// ============================================================================

Value ValueGenerator::generate(const Type * type, int depth)
{
  const Type * t = concretise(type);
  switch (t->kind) {
    case TypeKind::String:
      return generate_string(t);
    case TypeKind::Number:
      return generate_number(t);
    case TypeKind::Boolean:
      return Value::make_bool(coin());
    case TypeKind::Literal:
      return t->literal;
    case TypeKind::Enum: {
      std::uniform_int_distribution<size_t> pick(0, t->enum_variants.size() - 1);
      return Value::make_string(t->enum_variants[pick(engine_)]);
    }
    case TypeKind::Object:
    case TypeKind::Entity:
      return generate_record(t, depth);
    case TypeKind::Array:
      return generate_array(t, depth);
    case TypeKind::Optional:
      if (depth <= 0 || coin()) {
        return Value::make_undefined();
      }
      return generate(t->inner, depth);
    case TypeKind::Nullable:
      if (depth <= 0 || coin()) {
        return Value::make_null();
      }
      return generate(t->inner, depth);
    case TypeKind::Reference:
      return generate(t->inner, depth);
    case TypeKind::Union:
      return generate_union(t, depth);
    case TypeKind::Custom:
      if (!t->codec.generate) {
        throw std::logic_error(
          fmt::format("custom type '{}' has no value generator", t->custom_name));
      }
      return t->codec.generate(engine_, depth, t->custom_options);
    case TypeKind::Lazy:
      break;
  }
  throw std::logic_error("unexpected lazy type after concretise");
}

// ============================================================================
// Scalars
// ============================================================================

Value ValueGenerator::generate_string(const Type * type)
{
  const StringOptions & o = type->string_options;

  if (o.regex) {
    if (o.min_length || o.max_length) {
      throw std::logic_error(fmt::format(
        "cannot generate a string with both a regex ({}) and length bounds", *o.regex));
    }
    auto & sampler = samplers_[type];
    if (!sampler) {
      sampler = std::make_shared<const RegexSampler>(*o.regex);
    }
    for (int attempt = 0; attempt < k_regex_attempts; ++attempt) {
      std::string candidate = sampler->sample(engine_);
      if (std::regex_match(candidate, *type->pattern)) {
        return Value::make_string(std::move(candidate));
      }
    }
    throw std::logic_error(fmt::format("unable to generate a string matching {}", *o.regex));
  }

  const size_t min = o.min_length.value_or(0);
  const size_t max = o.max_length.value_or(min + 8);
  std::uniform_int_distribution<size_t> pick_length(min, max);
  std::uniform_int_distribution<size_t> pick_char(0, k_alphabet.size() - 1);

  std::string out;
  const size_t length = pick_length(engine_);
  for (size_t i = 0; i < length; ++i) {
    out += k_alphabet[pick_char(engine_)];
  }
  return Value::make_string(std::move(out));
}

Value ValueGenerator::generate_number(const Type * type)
{
  const NumberOptions & o = type->number_options;
  std::optional<double> low;
  std::optional<double> high;

  if (type->is_integer) {
    if (o.minimum) {
      low = std::ceil(*o.minimum);
    } else if (o.exclusive_minimum) {
      low = std::floor(*o.exclusive_minimum) + 1.0;
    }
    if (o.maximum) {
      high = std::floor(*o.maximum);
    } else if (o.exclusive_maximum) {
      high = std::ceil(*o.exclusive_maximum) - 1.0;
    }
  } else {
    if (o.minimum) {
      low = *o.minimum;
    } else if (o.exclusive_minimum) {
      low = std::nextafter(*o.exclusive_minimum, std::numeric_limits<double>::infinity());
    }
    if (o.maximum) {
      high = *o.maximum;
    } else if (o.exclusive_maximum) {
      high = std::nextafter(*o.exclusive_maximum, -std::numeric_limits<double>::infinity());
    }
  }

  if (!low && !high) {
    low = -k_default_span;
    high = k_default_span;
  } else if (!low) {
    low = *high - k_default_span;
  } else if (!high) {
    high = *low + k_default_span;
  }

  if (*low >= *high) {
    return Value::make_number(*low);
  }
  if (type->is_integer) {
    std::uniform_int_distribution<int64_t> pick(
      static_cast<int64_t>(*low), static_cast<int64_t>(*high));
    return Value::make_number(static_cast<double>(pick(engine_)));
  }
  std::uniform_real_distribution<double> pick(*low, *high);
  return Value::make_number(std::clamp(pick(engine_), *low, *high));
}

// ============================================================================
// Composites
// ============================================================================

Value ValueGenerator::generate_array(const Type * type, int depth)
{
  const size_t min = type->array_options.min_items.value_or(0);
  size_t count = min;
  if (depth > 0) {
    const size_t max = type->array_options.max_items.value_or(min + 3);
    count = std::uniform_int_distribution<size_t>(min, max)(engine_);
  }

  Value::Array items;
  items.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    items.push_back(generate(type->inner, depth - 1));
  }
  return Value::make_array(std::move(items));
}

Value ValueGenerator::generate_record(const Type * type, int depth)
{
  if (depth <= 0 && height(type) == k_unbounded) {
    throw std::logic_error(
      fmt::format("cannot generate {}: it requires itself", to_string(type)));
  }

  Value out = Value::make_object();
  for (const auto & field : type->fields) {
    Value value = generate(field.type, depth - 1);
    if (!value.is_undefined()) {
      out.set(field.name, std::move(value));
    }
  }
  return out;
}

Value ValueGenerator::generate_union(const Type * type, int depth)
{
  // Out of depth: only the variants closest to a leaf
  size_t lowest = k_unbounded;
  if (depth <= 0) {
    for (const auto & v : type->variants) {
      lowest = std::min(lowest, height(v.type));
    }
  }

  std::vector<const Variant *> candidates;
  for (const auto & v : type->variants) {
    if (depth > 0 || lowest == k_unbounded || height(v.type) == lowest) {
      candidates.push_back(&v);
    }
  }

  std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
  return generate(candidates[pick(engine_)]->type, depth - 1);
}

ValueGenerator arbitrary(const Type * type, uint64_t seed, int max_depth)
{
  return ValueGenerator(type, seed, max_depth);
}

}  // namespace typecraft
