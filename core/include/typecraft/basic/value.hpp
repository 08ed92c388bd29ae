// typecraft/basic/value.hpp - Dynamically typed value representation
//
// Represents both untyped decoder input and decoded values.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace typecraft
{

// ============================================================================
// Value Kind
// ============================================================================

/**
 * Kind of value.
 */
enum class ValueKind {
  Undefined,  ///< Absent value (missing field, empty optional)
  Null,       ///< null
  Boolean,    ///< true / false
  Number,     ///< 64-bit floating point
  String,     ///< UTF-8 string
  Array,      ///< Ordered list of values
  Object,     ///< Insertion-ordered key/value pairs
};

// ============================================================================
// Value
// ============================================================================

/**
 * Dynamically typed value.
 *
 * Undefined models an absent value: object fields holding Undefined are
 * treated as missing by every query and comparison.
 */
class Value
{
public:
  using Array = std::vector<Value>;
  using Field = std::pair<std::string, Value>;
  using Object = std::vector<Field>;

  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_undefined() { return Value{}; }

  static Value make_null()
  {
    Value v;
    v.kind_ = ValueKind::Null;
    return v;
  }

  static Value make_bool(bool value)
  {
    Value v;
    v.kind_ = ValueKind::Boolean;
    v.bool_ = value;
    return v;
  }

  static Value make_number(double value)
  {
    Value v;
    v.kind_ = ValueKind::Number;
    v.number_ = value;
    return v;
  }

  static Value make_string(std::string value)
  {
    Value v;
    v.kind_ = ValueKind::String;
    v.string_ = std::move(value);
    return v;
  }

  static Value make_array(Array items = {})
  {
    Value v;
    v.kind_ = ValueKind::Array;
    v.items_ = std::move(items);
    return v;
  }

  static Value make_object(Object fields = {})
  {
    Value v;
    v.kind_ = ValueKind::Object;
    v.fields_ = std::move(fields);
    return v;
  }

  /// Convert from JSON (integers become numbers, key order follows the JSON object)
  static Value from_json(const nlohmann::json & json);

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_undefined() const noexcept { return kind_ == ValueKind::Undefined; }

  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }

  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Boolean; }

  [[nodiscard]] bool is_number() const noexcept { return kind_ == ValueKind::Number; }

  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }

  [[nodiscard]] bool is_array() const noexcept { return kind_ == ValueKind::Array; }

  [[nodiscard]] bool is_object() const noexcept { return kind_ == ValueKind::Object; }

  /// Check if this is a number without a fractional part
  [[nodiscard]] bool is_integral() const noexcept;

  // ===========================================================================
  // Accessors (caller must check kind first)
  // ===========================================================================

  [[nodiscard]] bool as_bool() const noexcept { return bool_; }

  [[nodiscard]] double as_number() const noexcept { return number_; }

  [[nodiscard]] const std::string & as_string() const noexcept { return string_; }

  [[nodiscard]] gsl::span<const Value> as_array() const noexcept
  {
    return {items_.data(), items_.size()};
  }

  [[nodiscard]] gsl::span<const Field> fields() const noexcept
  {
    return {fields_.data(), fields_.size()};
  }

  /// Number of array items or defined object fields
  [[nodiscard]] size_t size() const noexcept;

  // ===========================================================================
  // Object Access
  // ===========================================================================

  /// Find a defined field (nullptr when missing or Undefined)
  [[nodiscard]] const Value * find(std::string_view key) const noexcept;

  /// Get a field, Undefined when missing
  [[nodiscard]] Value get(std::string_view key) const;

  [[nodiscard]] bool has(std::string_view key) const noexcept { return find(key) != nullptr; }

  /// Set a field, replacing an existing entry with the same key
  void set(std::string key, Value value);

  /// Remove a field if present
  void erase(std::string_view key);

  /// Append an array item
  void push_back(Value value);

  // ===========================================================================
  // Conversion
  // ===========================================================================

  /// Convert to JSON (Undefined becomes null, Undefined fields are skipped)
  [[nodiscard]] nlohmann::json to_json() const;

  /// Compact JSON-like rendering, "undefined" for Undefined
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Value & lhs, const Value & rhs);
  friend bool operator!=(const Value & lhs, const Value & rhs) { return !(lhs == rhs); }

private:
  ValueKind kind_ = ValueKind::Undefined;
  bool bool_ = false;
  double number_ = 0.0;
  std::string string_;
  Array items_;
  Object fields_;
};

/// Render a value for gtest failure messages
void PrintTo(const Value & value, std::ostream * os);

}  // namespace typecraft
