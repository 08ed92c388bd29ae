// typecraft/basic/path.hpp - Accessor trail attached to errors
//
// Paths are immutable: every operation returns a new path.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace typecraft
{

enum class PathSegmentKind {
  Field,    ///< .name
  Index,    ///< [n]
  Variant,  ///< {name}
};

struct PathSegment
{
  PathSegmentKind kind = PathSegmentKind::Field;
  std::string name;  ///< Field or variant name
  size_t index = 0;  ///< Array index

  friend bool operator==(const PathSegment & a, const PathSegment & b)
  {
    return a.kind == b.kind && a.name == b.name && a.index == b.index;
  }
};

/**
 * Ordered sequence of field / index / variant segments.
 *
 * Rendered JSONPath-like: `$`, `$.user.name`, `$['odd key']`, `$.tags[2]`,
 * `$.shape{circle}.radius`.
 */
class Path
{
public:
  Path() = default;

  [[nodiscard]] Path prepend_field(std::string_view name) const;
  [[nodiscard]] Path prepend_index(size_t index) const;
  [[nodiscard]] Path prepend_variant(std::string_view name) const;

  [[nodiscard]] Path append_field(std::string_view name) const;
  [[nodiscard]] Path append_index(size_t index) const;
  [[nodiscard]] Path append_variant(std::string_view name) const;

  [[nodiscard]] gsl::span<const PathSegment> segments() const noexcept
  {
    return {segments_.data(), segments_.size()};
  }

  [[nodiscard]] bool is_root() const noexcept { return segments_.empty(); }

  /// Check if `prefix` is this path or one of its ancestors
  [[nodiscard]] bool starts_with(const Path & prefix) const noexcept;

  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Path & a, const Path & b) { return a.segments_ == b.segments_; }

private:
  explicit Path(std::vector<PathSegment> segments) : segments_(std::move(segments)) {}

  [[nodiscard]] Path prepend(PathSegment segment) const;
  [[nodiscard]] Path append(PathSegment segment) const;

  std::vector<PathSegment> segments_;
};

}  // namespace typecraft
