#pragma once

#include "ast.hpp"
#include "common.hpp"
#include "trace.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace bkregex {
struct Match {
  size_t start;
  size_t end;

  [[nodiscard]] constexpr auto size() const -> size_t { return end - start; }
  constexpr auto operator==(Match const &) const -> bool = default;
};

struct PatternImpl;

// A compiled pattern. Compilation throws PatternSyntaxError on malformed
// input. Once built a Pattern is never modified, so a single instance can be
// queried from several threads at once.
//
// Matching is plain backtracking without memoization: nested unbounded
// quantifiers such as "(a*)*b" can take exponential time on some inputs.
class Pattern {
  std::unique_ptr<PatternImpl> impl_;

public:
  explicit Pattern(std::string_view pattern);

  Pattern(Pattern &&) noexcept;
  auto operator=(Pattern &&) noexcept -> Pattern &;
  ~Pattern();

  [[nodiscard]] auto pattern() const -> std::string_view;
  [[nodiscard]] auto root() const -> Node const &;

  // True iff the whole of `text` matches
  [[nodiscard]] auto match(std::string_view text) const -> bool;
  auto match(std::string_view text, MatchObserver &) const -> bool;

  // Leftmost start position with any match, paired with the first end
  // position the tree offers there. That end is not necessarily the longest.
  [[nodiscard]] auto search(std::string_view text) const
      -> std::optional<Match>;
  auto search(std::string_view text, MatchObserver &) const
      -> std::optional<Match>;

  // Non-overlapping matches in ascending order. Empty matches are reported
  // and the scan then moves on by one character.
  [[nodiscard]] auto findall(std::string_view text) const
      -> std::vector<Match>;
  auto findall(std::string_view text, MatchObserver &) const
      -> std::vector<Match>;

  // Graphviz digraph of the pattern tree
  auto visualize(std::ostream &) const -> void;
};
} // namespace bkregex
