// typecraft/arbitrary/regex_sampler.hpp - Random strings from a regex
//
// Supports the ECMAScript subset used by string constraints: literals,
// escapes (\d \w \s and their negations), character classes, '.',
// groups, alternation, quantifiers (? * + {n} {n,} {n,m}) and anchors.
//
#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace typecraft
{

class RegexSampler
{
public:
  /**
   * Parse a pattern.
   *
   * @throws std::invalid_argument on unsupported or malformed syntax
   */
  explicit RegexSampler(std::string_view pattern);

  /// Produce a string described by the pattern
  [[nodiscard]] std::string sample(std::mt19937_64 & engine) const;

private:
  enum class AtomKind {
    Literal,
    Class,
    Group,
  };

  struct Atom
  {
    AtomKind kind = AtomKind::Literal;
    char literal = '\0';
    std::vector<char> chars;  ///< For Class
    size_t group = 0;         ///< For Group
  };

  struct Piece
  {
    Atom atom;
    size_t min = 1;
    size_t max = 1;
  };

  using Sequence = std::vector<Piece>;
  using Alternation = std::vector<Sequence>;

  // Parser
  size_t parse_alternation();
  Sequence parse_sequence();
  bool parse_piece(Sequence & sequence);
  Atom parse_atom();
  Atom parse_class();
  Atom parse_escape();
  void parse_quantifier(Piece & piece);
  size_t parse_count();

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= pattern_.size(); }
  [[nodiscard]] char peek() const noexcept { return pattern_[pos_]; }
  [[noreturn]] void error(std::string_view message) const;

  void sample_alternation(size_t group, std::mt19937_64 & engine, std::string & out) const;

  std::string pattern_;
  size_t pos_ = 0;
  std::vector<Alternation> groups_;  ///< groups_[0] is the whole pattern
};

}  // namespace typecraft
