#pragma once

#include "common.hpp"

#include <bitset>
#include <climits>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bkregex {
// Repetition operators. The lazy forms enumerate their candidates in the same
// ascending order as the greedy ones, they differ only in how they recurse.
namespace quantifier {
struct Star {
  static constexpr std::string_view type = "Star";
  static constexpr std::string_view symbol = "*";
};
struct Plus {
  static constexpr std::string_view type = "Plus";
  static constexpr std::string_view symbol = "+";
};
struct Question {
  static constexpr std::string_view type = "Question";
  static constexpr std::string_view symbol = "?";
};
struct LazyStar {
  static constexpr std::string_view type = "LazyStar";
  static constexpr std::string_view symbol = "*?";
};
struct LazyPlus {
  static constexpr std::string_view type = "LazyPlus";
  static constexpr std::string_view symbol = "+?";
};
struct LazyQuestion {
  static constexpr std::string_view type = "LazyQuestion";
  static constexpr std::string_view symbol = "??";
};

using QuantifiersList =
    meta::TypeList<Star, Plus, Question, LazyStar, LazyPlus, LazyQuestion>;
} // namespace quantifier

namespace direction {
struct Ahead {
  static constexpr std::string_view type = "Lookahead";
};
struct Behind {
  static constexpr std::string_view type = "Lookbehind";
};

using DirectionsList = meta::TypeList<Ahead, Behind>;
} // namespace direction

// A node of the pattern tree. Every node can enumerate, for a position in the
// text, the positions at which it could stop matching. The tree is built once
// by the parser and never modified afterwards.
struct Node {
  struct Literal {
    char value;
  };

  // Any single character, line terminators included
  struct Dot {};

  struct CharClass {
    std::bitset<UCHAR_MAX + 1> members;
    bool is_complement;

    [[nodiscard]] auto contains(char c) const -> bool {
      return members.test(static_cast<unsigned char>(c));
    }
  };

  // Zero-width text boundaries
  struct Start {};
  struct End {};

  struct Sequence {
    std::vector<Node> nodes;
  };

  struct Alternation {
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
  };

  struct NonCaptureGroup {
    std::unique_ptr<Node> child;
  };

  template <typename Kind> struct Quantified {
    std::unique_ptr<Node> child;
  };
  using QuantifiedNodes = meta::apply<Quantified, quantifier::QuantifiersList>;

  template <typename Direction> struct Lookaround {
    std::unique_ptr<Node> child;
    bool is_positive;
  };
  using LookaroundNodes = meta::apply<Lookaround, direction::DirectionsList>;

  using NodeTypeList = meta::concat<
      meta::TypeList<Literal, Dot, CharClass, Start, End, Sequence,
                     Alternation, NonCaptureGroup>,
      meta::concat<QuantifiedNodes, LookaroundNodes>>;

  using NodeVariant = meta::rename<std::variant, NodeTypeList>;
  NodeVariant type;
};

// Introspection, used by the visualizer and the tracer

// Stable tag naming the kind of node, eg. "Literal" or "LazyPlus"
auto type_name(Node const &) -> std::string_view;

// The node's own data: the character of a literal, the members of a class or
// the polarity of a lookaround. Empty for every other node.
auto describe(Node const &) -> std::string;

// Structural children in matching order
auto children(Node const &) -> std::vector<Node const *>;
} // namespace bkregex
