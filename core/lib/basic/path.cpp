// typecraft/basic/path.cpp - Path implementation
#include "typecraft/basic/path.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace typecraft
{

namespace
{

bool is_identifier(std::string_view name)
{
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  for (const char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_' && c != '$') {
      return false;
    }
  }
  return true;
}

std::string quote_key(std::string_view name)
{
  std::string out;
  out.reserve(name.size() + 2);
  for (const char c : name) {
    if (c == '\'' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  return out;
}

}  // namespace

Path Path::prepend(PathSegment segment) const
{
  std::vector<PathSegment> segments;
  segments.reserve(segments_.size() + 1);
  segments.push_back(std::move(segment));
  segments.insert(segments.end(), segments_.begin(), segments_.end());
  return Path(std::move(segments));
}

Path Path::append(PathSegment segment) const
{
  std::vector<PathSegment> segments = segments_;
  segments.push_back(std::move(segment));
  return Path(std::move(segments));
}

Path Path::prepend_field(std::string_view name) const
{
  return prepend(PathSegment{PathSegmentKind::Field, std::string(name), 0});
}

Path Path::prepend_index(size_t index) const
{
  return prepend(PathSegment{PathSegmentKind::Index, {}, index});
}

Path Path::prepend_variant(std::string_view name) const
{
  return prepend(PathSegment{PathSegmentKind::Variant, std::string(name), 0});
}

Path Path::append_field(std::string_view name) const
{
  return append(PathSegment{PathSegmentKind::Field, std::string(name), 0});
}

Path Path::append_index(size_t index) const
{
  return append(PathSegment{PathSegmentKind::Index, {}, index});
}

Path Path::append_variant(std::string_view name) const
{
  return append(PathSegment{PathSegmentKind::Variant, std::string(name), 0});
}

bool Path::starts_with(const Path & prefix) const noexcept
{
  return prefix.segments_.size() <= segments_.size() &&
         std::equal(prefix.segments_.begin(), prefix.segments_.end(), segments_.begin());
}

std::string Path::to_string() const
{
  std::string out = "$";
  for (const auto & seg : segments_) {
    switch (seg.kind) {
      case PathSegmentKind::Field:
        if (is_identifier(seg.name)) {
          out += fmt::format(".{}", seg.name);
        } else {
          out += fmt::format("['{}']", quote_key(seg.name));
        }
        break;
      case PathSegmentKind::Index:
        out += fmt::format("[{}]", seg.index);
        break;
      case PathSegmentKind::Variant:
        out += fmt::format("{{{}}}", seg.name);
        break;
    }
  }
  return out;
}

}  // namespace typecraft
