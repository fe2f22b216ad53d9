#include "bkregex/regex.hpp"

#include "private/evaluation.hpp"
#include "private/parser.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace bkregex;
using namespace bkregex::evaluation;

struct bkregex::PatternImpl {
  std::string source;
  Node root;
};

namespace {
auto full_match(Node const &root, std::string_view text,
                MatchObserver *observer) -> bool {
  Context const context{.text = text, .observer = observer};

  // The first candidate is not necessarily the one that spans the whole text
  bool did_match = false;
  produce(context, root, 0, [&](size_t end) {
    if (end != text.size()) {
      return Control::next;
    }
    did_match = true;
    return Control::stop;
  });
  return did_match;
}

auto leftmost_match(Node const &root, std::string_view text,
                    MatchObserver *observer) -> std::optional<Match> {
  Context const context{.text = text, .observer = observer};
  for (size_t start = 0; start <= text.size(); start += 1) {
    if (auto end = first_candidate(context, root, start)) {
      return Match{.start = start, .end = *end};
    }
  }
  return std::nullopt;
}

auto all_matches(Node const &root, std::string_view text,
                 MatchObserver *observer) -> std::vector<Match> {
  Context const context{.text = text, .observer = observer};

  std::vector<Match> matches;
  size_t position = 0;
  while (position <= text.size()) {
    auto end = first_candidate(context, root, position);
    if (not end.has_value()) {
      position += 1;
      continue;
    }

    matches.push_back({.start = position, .end = *end});
    // Always advance, even past an empty match
    position = std::max(position + 1, *end);
  }
  return matches;
}
} // namespace

Pattern::Pattern(std::string_view pattern)
    : impl_{std::make_unique<PatternImpl>(std::string{pattern},
                                          parse(pattern))} {}

Pattern::Pattern(Pattern &&) noexcept = default;
auto Pattern::operator=(Pattern &&) noexcept -> Pattern & = default;
Pattern::~Pattern() = default;

auto Pattern::pattern() const -> std::string_view { return impl_->source; }

auto Pattern::root() const -> Node const & { return impl_->root; }

auto Pattern::match(std::string_view text) const -> bool {
  return full_match(impl_->root, text, nullptr);
}

auto Pattern::match(std::string_view text, MatchObserver &observer) const
    -> bool {
  return full_match(impl_->root, text, &observer);
}

auto Pattern::search(std::string_view text) const -> std::optional<Match> {
  return leftmost_match(impl_->root, text, nullptr);
}

auto Pattern::search(std::string_view text, MatchObserver &observer) const
    -> std::optional<Match> {
  return leftmost_match(impl_->root, text, &observer);
}

auto Pattern::findall(std::string_view text) const -> std::vector<Match> {
  return all_matches(impl_->root, text, nullptr);
}

auto Pattern::findall(std::string_view text, MatchObserver &observer) const
    -> std::vector<Match> {
  return all_matches(impl_->root, text, &observer);
}
