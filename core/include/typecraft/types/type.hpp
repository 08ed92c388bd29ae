// typecraft/types/type.hpp - Runtime type representation
//
// Types are immutable nodes owned by a TypeContext and referenced
// through `const Type *` handles. A handle may point to a Lazy node,
// which must be concretised before its shape can be inspected.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory_resource>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "typecraft/basic/value.hpp"
#include "typecraft/codec/errors.hpp"
#include "typecraft/codec/options.hpp"

namespace typecraft
{

struct Type;

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of type node.
 */
enum class TypeKind {
  // Scalars
  String,
  Number,
  Boolean,
  Literal,  ///< Exactly one scalar value
  Enum,     ///< One of a fixed set of strings

  // Records
  Object,
  Entity,  ///< Identity-bearing record (relations, retrieve)

  // Wrappers
  Array,
  Optional,   ///< May be absent
  Nullable,   ///< May be null
  Reference,  ///< Foreign-key-like pointer, transparent for codecs

  Union,   ///< Named variants
  Custom,  ///< User supplied callbacks

  Lazy,  ///< Indirection resolved by concretise()
};

enum class Mutability {
  Immutable,
  Mutable,
};

// ============================================================================
// Options
// ============================================================================

/**
 * Options shared by every kind.
 */
struct TypeOptions
{
  std::optional<std::string> name;
  std::optional<std::string> description;

  /// Encoded as null when encoding with SensitiveInformationStrategy::Hide
  bool sensitive = false;
};

struct StringOptions
{
  std::optional<size_t> min_length;  ///< In Unicode code points
  std::optional<size_t> max_length;
  std::optional<std::string> regex;  ///< ECMAScript syntax, full match
};

struct NumberOptions
{
  std::optional<double> minimum;
  std::optional<double> maximum;
  std::optional<double> exclusive_minimum;
  std::optional<double> exclusive_maximum;
};

struct ArrayOptions
{
  std::optional<size_t> min_items;
  std::optional<size_t> max_items;
};

// ============================================================================
// Children
// ============================================================================

struct Field
{
  std::string name;
  const Type * type = nullptr;
};

struct Variant
{
  std::string name;
  const Type * type = nullptr;
};

// ============================================================================
// Custom Type Callbacks
// ============================================================================

/**
 * Behaviour of a Custom type.
 *
 * Every callback receives the type's custom options as last argument.
 * `generate` may be empty, in which case arbitrary generation fails.
 */
struct CustomCodec
{
  std::function<DecodeResult(const Value &, const DecodingOptions &, const nlohmann::json &)>
    decode;
  std::function<nlohmann::json(const Value &, const EncodingOptions &, const nlohmann::json &)>
    encode;
  std::function<ValidationResult(const Value &, const ValidationOptions &, const nlohmann::json &)>
    validate;
  std::function<Value(std::mt19937_64 &, int, const nlohmann::json &)> generate;
};

// ============================================================================
// Lazy Slot
// ============================================================================

/**
 * Resolve-once storage behind a Lazy node.
 */
struct LazySlot
{
  std::function<const Type *()> producer;
  std::once_flag once;
  const Type * resolved = nullptr;
};

// ============================================================================
// Type
// ============================================================================

/**
 * Type node.
 *
 * Only the fields relevant to `kind` are meaningful.
 */
struct Type
{
  TypeKind kind;
  TypeOptions options;

  /// For String
  StringOptions string_options;
  std::optional<std::regex> pattern;

  /// For Number
  NumberOptions number_options;
  bool is_integer = false;

  /// For Literal
  Value literal;

  /// For Enum
  std::vector<std::string> enum_variants;

  /// For Object/Entity
  std::vector<Field> fields;

  /// For Object/Entity/Array
  Mutability mutability = Mutability::Immutable;

  /// For Array: item type, for Optional/Nullable/Reference: wrapped type
  const Type * inner = nullptr;
  ArrayOptions array_options;

  /// For Union
  std::vector<Variant> variants;

  /// For Custom
  std::string custom_name;
  CustomCodec codec;
  nlohmann::json custom_options;

  /// For Lazy
  uint64_t lazy_id = 0;
  LazySlot * slot = nullptr;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_lazy() const noexcept { return kind == TypeKind::Lazy; }

  [[nodiscard]] bool is_record() const noexcept
  {
    return kind == TypeKind::Object || kind == TypeKind::Entity;
  }

  [[nodiscard]] bool is_wrapper() const noexcept
  {
    return kind == TypeKind::Optional || kind == TypeKind::Nullable ||
           kind == TypeKind::Reference || kind == TypeKind::Array;
  }

  [[nodiscard]] bool is_scalar() const noexcept
  {
    return kind == TypeKind::String || kind == TypeKind::Number || kind == TypeKind::Boolean ||
           kind == TypeKind::Literal || kind == TypeKind::Enum || kind == TypeKind::Custom;
  }

  /// Display name: options.name if set, otherwise empty
  [[nodiscard]] std::string_view name() const noexcept
  {
    return options.name ? std::string_view(*options.name) : std::string_view{};
  }

  /// Find a record field by name
  [[nodiscard]] const Field * find_field(std::string_view field_name) const noexcept;

  /// Find a union variant by name
  [[nodiscard]] const Variant * find_variant(std::string_view variant_name) const noexcept;

  /// Index of a union variant, or variants.size() when absent
  [[nodiscard]] size_t variant_index(std::string_view variant_name) const noexcept;
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owner of type nodes.
 *
 * Nodes have stable addresses for the lifetime of the context. Every
 * factory validates its arguments and throws std::invalid_argument on
 * a malformed type.
 *
 * Construction is not thread-safe; reading and concretising are.
 */
class TypeContext
{
public:
  TypeContext() = default;

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Scalars
  // ===========================================================================

  [[nodiscard]] const Type * string_type(StringOptions string_options = {}, TypeOptions options = {});
  [[nodiscard]] const Type * number_type(NumberOptions number_options = {}, TypeOptions options = {});
  [[nodiscard]] const Type * integer_type(
    NumberOptions number_options = {}, TypeOptions options = {});
  [[nodiscard]] const Type * boolean_type(TypeOptions options = {});

  /// Literal of a null, boolean, number or string value
  [[nodiscard]] const Type * literal_type(Value literal, TypeOptions options = {});

  [[nodiscard]] const Type * enum_type(std::vector<std::string> variants, TypeOptions options = {});

  // ===========================================================================
  // Records
  // ===========================================================================

  [[nodiscard]] const Type * object_type(std::vector<Field> fields, TypeOptions options = {});
  [[nodiscard]] const Type * mutable_object_type(
    std::vector<Field> fields, TypeOptions options = {});

  /// Entity fields may not be named AND, OR or NOT
  [[nodiscard]] const Type * entity_type(std::vector<Field> fields, TypeOptions options = {});
  [[nodiscard]] const Type * mutable_entity_type(
    std::vector<Field> fields, TypeOptions options = {});

  // ===========================================================================
  // Wrappers
  // ===========================================================================

  [[nodiscard]] const Type * array_type(
    const Type * item, ArrayOptions array_options = {}, TypeOptions options = {});
  [[nodiscard]] const Type * mutable_array_type(
    const Type * item, ArrayOptions array_options = {}, TypeOptions options = {});
  [[nodiscard]] const Type * optional_type(const Type * inner, TypeOptions options = {});
  [[nodiscard]] const Type * nullable_type(const Type * inner, TypeOptions options = {});
  [[nodiscard]] const Type * reference_type(const Type * inner, TypeOptions options = {});

  // ===========================================================================
  // Union / Custom / Lazy
  // ===========================================================================

  [[nodiscard]] const Type * union_type(std::vector<Variant> variants, TypeOptions options = {});

  /// `decode`, `encode` and `validate` are required
  [[nodiscard]] const Type * custom_type(
    std::string name, CustomCodec codec, nlohmann::json custom_options = nlohmann::json::object(),
    TypeOptions options = {});

  /**
   * Create a lazy indirection.
   *
   * The producer runs at most once, on the first concretise(). It may
   * refer to the returned handle itself to build recursive types.
   */
  [[nodiscard]] const Type * lazy_type(std::function<const Type *()> producer);

  /// Copy of a concrete node with different base options
  [[nodiscard]] const Type * with_options(const Type * type, TypeOptions options);

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  const Type * make_record(
    TypeKind kind, std::vector<Field> fields, Mutability mutability, TypeOptions options);
  const Type * make_array(
    const Type * item, ArrayOptions array_options, Mutability mutability, TypeOptions options);
  const Type * make_wrapper(TypeKind kind, const Type * inner, TypeOptions options);
  const Type * make_number(NumberOptions number_options, bool is_integer, TypeOptions options);
  const Type * intern(Type && type);

  std::pmr::monotonic_buffer_resource arena_{4096};
  // NOTE: handles are handed out widely, element addresses must stay stable.
  std::pmr::deque<Type> types_{&arena_};
  std::pmr::deque<LazySlot> lazy_slots_{&arena_};
  uint64_t next_lazy_id_ = 1;
};

}  // namespace typecraft
