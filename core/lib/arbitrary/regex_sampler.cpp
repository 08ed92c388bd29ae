// typecraft/arbitrary/regex_sampler.cpp - Regex subset parser and sampler
//
#include "typecraft/arbitrary/regex_sampler.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace typecraft
{

namespace
{

/// Extra repetitions allowed for unbounded quantifiers
constexpr size_t k_unbounded_extra = 3;

std::vector<char> printable()
{
  std::vector<char> out;
  for (int c = 32; c < 127; ++c) {
    out.push_back(static_cast<char>(c));
  }
  return out;
}

std::vector<char> digits()
{
  std::vector<char> out;
  for (char c = '0'; c <= '9'; ++c) {
    out.push_back(c);
  }
  return out;
}

std::vector<char> word_chars()
{
  std::vector<char> out;
  for (int c = 32; c < 127; ++c) {
    if (std::isalnum(c) != 0 || c == '_') {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

std::vector<char> space_chars() { return {' ', '\t', '\n', '\r', '\f', '\v'}; }

std::vector<char> complement(const std::vector<char> & chars)
{
  std::vector<char> out;
  for (const char c : printable()) {
    if (std::find(chars.begin(), chars.end(), c) == chars.end()) {
      out.push_back(c);
    }
  }
  return out;
}

/// Character class for \d \w \s \D \W \S, empty when `c` is not a class escape
std::vector<char> class_escape(char c)
{
  switch (c) {
    case 'd':
      return digits();
    case 'w':
      return word_chars();
    case 's':
      return space_chars();
    case 'D':
      return complement(digits());
    case 'W':
      return complement(word_chars());
    case 'S':
      return complement(space_chars());
    default:
      return {};
  }
}

char literal_escape(char c)
{
  switch (c) {
    case 'n':
      return '\n';
    case 't':
      return '\t';
    case 'r':
      return '\r';
    case 'f':
      return '\f';
    case 'v':
      return '\v';
    case '0':
      return '\0';
    default:
      return c;
  }
}

}  // namespace

RegexSampler::RegexSampler(std::string_view pattern) : pattern_(pattern)
{
  parse_alternation();
  if (!at_end()) {
    error("unbalanced ')'");
  }
}

void RegexSampler::error(std::string_view message) const
{
  throw std::invalid_argument(
    fmt::format("unsupported regex '{}' at offset {}: {}", pattern_, pos_, message));
}

// ============================================================================
// Parser
// ============================================================================

size_t RegexSampler::parse_alternation()
{
  const size_t index = groups_.size();
  groups_.emplace_back();

  Alternation options;
  options.push_back(parse_sequence());
  while (!at_end() && peek() == '|') {
    ++pos_;
    options.push_back(parse_sequence());
  }
  groups_[index] = std::move(options);
  return index;
}

RegexSampler::Sequence RegexSampler::parse_sequence()
{
  Sequence sequence;
  while (!at_end() && peek() != '|' && peek() != ')') {
    parse_piece(sequence);
  }
  return sequence;
}

bool RegexSampler::parse_piece(Sequence & sequence)
{
  const char c = peek();
  // Anchors and word boundaries produce no characters
  if (c == '^' || c == '$') {
    ++pos_;
    return false;
  }
  if (
    c == '\\' && pos_ + 1 < pattern_.size() &&
    (pattern_[pos_ + 1] == 'b' || pattern_[pos_ + 1] == 'B')) {
    pos_ += 2;
    return false;
  }

  Piece piece;
  piece.atom = parse_atom();
  parse_quantifier(piece);
  sequence.push_back(std::move(piece));
  return true;
}

RegexSampler::Atom RegexSampler::parse_atom()
{
  const char c = peek();
  Atom atom;
  switch (c) {
    case '(': {
      ++pos_;
      if (!at_end() && peek() == '?') {
        if (pos_ + 1 < pattern_.size() && pattern_[pos_ + 1] == ':') {
          pos_ += 2;
        } else {
          error("lookaround assertions are not supported");
        }
      }
      atom.kind = AtomKind::Group;
      atom.group = parse_alternation();
      if (at_end() || peek() != ')') {
        error("missing ')'");
      }
      ++pos_;
      return atom;
    }
    case '[':
      ++pos_;
      return parse_class();
    case '.':
      ++pos_;
      atom.kind = AtomKind::Class;
      atom.chars = printable();
      return atom;
    case '\\':
      ++pos_;
      return parse_escape();
    case '*':
    case '+':
    case '?':
    case '{':
      error("quantifier without a target");
    default:
      ++pos_;
      atom.literal = c;
      return atom;
  }
}

RegexSampler::Atom RegexSampler::parse_escape()
{
  if (at_end()) {
    error("trailing '\\'");
  }
  const char c = peek();
  ++pos_;
  if (std::isdigit(static_cast<unsigned char>(c)) != 0 && c != '0') {
    error("back references are not supported");
  }

  Atom atom;
  auto chars = class_escape(c);
  if (!chars.empty()) {
    atom.kind = AtomKind::Class;
    atom.chars = std::move(chars);
  } else {
    atom.literal = literal_escape(c);
  }
  return atom;
}

RegexSampler::Atom RegexSampler::parse_class()
{
  Atom atom;
  atom.kind = AtomKind::Class;

  bool negate = false;
  if (!at_end() && peek() == '^') {
    negate = true;
    ++pos_;
  }

  std::vector<char> chars;
  bool first = true;
  while (!at_end() && (peek() != ']' || first)) {
    first = false;
    char low = peek();
    ++pos_;
    if (low == '\\') {
      if (at_end()) {
        error("trailing '\\' in class");
      }
      const char e = peek();
      ++pos_;
      auto set = class_escape(e);
      if (!set.empty()) {
        chars.insert(chars.end(), set.begin(), set.end());
        continue;
      }
      low = literal_escape(e);
    }

    // Range a-z
    if (pos_ + 1 < pattern_.size() && peek() == '-' && pattern_[pos_ + 1] != ']') {
      ++pos_;
      char high = peek();
      ++pos_;
      if (high == '\\') {
        if (at_end()) {
          error("trailing '\\' in class");
        }
        high = literal_escape(peek());
        ++pos_;
      }
      if (high < low) {
        error("inverted class range");
      }
      for (int ch = low; ch <= high; ++ch) {
        chars.push_back(static_cast<char>(ch));
      }
      continue;
    }
    chars.push_back(low);
  }
  if (at_end()) {
    error("missing ']'");
  }
  ++pos_;

  atom.chars = negate ? complement(chars) : std::move(chars);
  if (atom.chars.empty()) {
    error("empty character class");
  }
  return atom;
}

void RegexSampler::parse_quantifier(Piece & piece)
{
  if (at_end()) {
    return;
  }
  switch (peek()) {
    case '*':
      ++pos_;
      piece.min = 0;
      piece.max = k_unbounded_extra;
      break;
    case '+':
      ++pos_;
      piece.min = 1;
      piece.max = 1 + k_unbounded_extra;
      break;
    case '?':
      ++pos_;
      piece.min = 0;
      piece.max = 1;
      break;
    case '{': {
      ++pos_;
      piece.min = parse_count();
      piece.max = piece.min;
      if (!at_end() && peek() == ',') {
        ++pos_;
        piece.max = (!at_end() && peek() == '}') ? piece.min + k_unbounded_extra : parse_count();
      }
      if (at_end() || peek() != '}') {
        error("missing '}'");
      }
      ++pos_;
      if (piece.max < piece.min) {
        error("quantifier maximum below minimum");
      }
      break;
    }
    default:
      return;
  }
  // Lazy quantifier marker does not change the language
  if (!at_end() && peek() == '?') {
    ++pos_;
  }
}

size_t RegexSampler::parse_count()
{
  size_t value = 0;
  bool any = false;
  while (!at_end() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    value = value * 10 + static_cast<size_t>(peek() - '0');
    ++pos_;
    any = true;
  }
  if (!any) {
    error("expected a repetition count");
  }
  return value;
}

// ============================================================================
// Sampling
// ============================================================================

void RegexSampler::sample_alternation(
  size_t group, std::mt19937_64 & engine, std::string & out) const
{
  const Alternation & options = groups_[group];
  std::uniform_int_distribution<size_t> pick_option(0, options.size() - 1);
  const Sequence & sequence = options[pick_option(engine)];

  for (const auto & piece : sequence) {
    std::uniform_int_distribution<size_t> pick_count(piece.min, piece.max);
    const size_t count = pick_count(engine);
    for (size_t i = 0; i < count; ++i) {
      switch (piece.atom.kind) {
        case AtomKind::Literal:
          out += piece.atom.literal;
          break;
        case AtomKind::Class: {
          std::uniform_int_distribution<size_t> pick_char(0, piece.atom.chars.size() - 1);
          out += piece.atom.chars[pick_char(engine)];
          break;
        }
        case AtomKind::Group:
          sample_alternation(piece.atom.group, engine, out);
          break;
      }
    }
  }
}

std::string RegexSampler::sample(std::mt19937_64 & engine) const
{
  std::string out;
  sample_alternation(0, engine, out);
  return out;
}

}  // namespace typecraft
