#include "private/parser.hpp"

#include "bkregex/ast.hpp"
#include "bkregex/common.hpp"

#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

using namespace bkregex;
using namespace std::string_view_literals;

namespace {
// Grammar, loosest binding first:
//   alternation := sequence ('|' alternation)?
//   sequence    := factor*
//   factor      := atom (('*' | '+' | '?') '?'?)?
//   atom        := group | class | '.' | '^' | '$' | '\' any | literal
struct Cursor {
  std::string_view text;
  size_t offset;

  constexpr auto is_at_end() const -> bool { return offset >= text.size(); }

  constexpr auto peek_or_throw() const -> char {
    if (is_at_end()) {
      throw PatternSyntaxError(offset, "Unexpected end of pattern at offset {}"sv,
                               offset);
    }
    return peek();
  }

  constexpr auto peek() const -> char { return text[offset]; }

  constexpr auto eat_next() -> void { offset += 1; }

  constexpr auto try_eat(char to_eat) -> bool {
    if (is_next(to_eat)) {
      eat_next();
      return true;
    }
    return false;
  }

  constexpr auto try_eat(std::string_view to_eat) -> bool {
    if (text.substr(offset).starts_with(to_eat)) {
      offset += to_eat.size();
      return true;
    }
    return false;
  }

  constexpr auto is_next(char test_char) const -> bool {
    if (is_at_end()) {
      return false;
    }
    return peek() == test_char;
  }

  constexpr auto is_next_or_end(char test_char) const -> bool {
    if (is_at_end()) {
      return true;
    }
    return peek() == test_char;
  }
};

auto box(Node &&node) -> std::unique_ptr<Node> {
  return std::make_unique<Node>(std::move(node));
}

template <typename Kind> auto quantify(Node &&node) -> Node {
  return {Node::Quantified<Kind>{box(std::move(node))}};
}

template <typename Direction>
auto look(Node &&node, bool is_positive) -> Node {
  return {Node::Lookaround<Direction>{box(std::move(node)), is_positive}};
}

auto parse_alternation(Cursor &cursor) -> Node;

auto eat_group_end(Cursor &cursor) -> void {
  if (not cursor.try_eat(')')) {
    throw PatternSyntaxError(cursor.offset,
                             "Missing closing parenthesis at offset {}"sv,
                             cursor.offset);
  }
}

auto parse_group(Cursor &cursor) -> Node {
  cursor.eat_next(); // '('

  if (cursor.try_eat("?:"sv)) {
    auto inner = parse_alternation(cursor);
    eat_group_end(cursor);
    return {Node::NonCaptureGroup{box(std::move(inner))}};
  }

  // Lookaround
  if (cursor.try_eat("?="sv)) {
    auto inner = parse_alternation(cursor);
    eat_group_end(cursor);
    return look<direction::Ahead>(std::move(inner), true);
  }
  if (cursor.try_eat("?!"sv)) {
    auto inner = parse_alternation(cursor);
    eat_group_end(cursor);
    return look<direction::Ahead>(std::move(inner), false);
  }
  if (cursor.try_eat("?<="sv)) {
    auto inner = parse_alternation(cursor);
    eat_group_end(cursor);
    return look<direction::Behind>(std::move(inner), true);
  }
  if (cursor.try_eat("?<!"sv)) {
    auto inner = parse_alternation(cursor);
    eat_group_end(cursor);
    return look<direction::Behind>(std::move(inner), false);
  }

  // Nothing is captured, a plain group only affects precedence
  auto inner = parse_alternation(cursor);
  eat_group_end(cursor);
  return inner;
}

// Members are taken literally: there are no ranges and no shorthand classes,
// a backslash only protects the next character.
auto parse_character_class(Cursor &cursor) -> Node {
  cursor.eat_next(); // '['

  Node::CharClass result{};
  result.is_complement = cursor.try_eat('^');

  while (not cursor.is_next_or_end(']')) {
    if (cursor.is_next('\\')) {
      size_t const escape_offset = cursor.offset;
      cursor.eat_next();
      if (cursor.is_at_end()) {
        throw PatternSyntaxError(
            escape_offset,
            "Pattern ends with an escape character in a class at offset {}"sv,
            escape_offset);
      }
    }
    result.members.set(static_cast<unsigned char>(cursor.peek()));
    cursor.eat_next();
  }

  if (cursor.is_at_end()) {
    throw PatternSyntaxError(cursor.offset,
                             "Missing closing bracket at offset {}"sv,
                             cursor.offset);
  }
  cursor.eat_next(); // ']'
  return {std::move(result)};
}

auto parse_atom(Cursor &cursor) -> Node {
  size_t const atom_offset = cursor.offset;
  char const next_char = cursor.peek_or_throw();
  switch (next_char) {
  default:
    cursor.eat_next();
    return {Node::Literal{next_char}};

  case '(':
    return parse_group(cursor);
  case '[':
    return parse_character_class(cursor);

  case '.':
    cursor.eat_next();
    return {Node::Dot{}};
  case '^':
    cursor.eat_next();
    return {Node::Start{}};
  case '$':
    cursor.eat_next();
    return {Node::End{}};

  case '\\':
    // Any escaped character is a literal, including letters such as 'd'
    cursor.eat_next();
    if (cursor.is_at_end()) {
      throw PatternSyntaxError(atom_offset,
                               "Pattern ends with '\\' at offset {}"sv,
                               atom_offset);
    }
    cursor.eat_next();
    return {Node::Literal{cursor.text[atom_offset + 1]}};

  case '*':
  case '+':
  case '?':
  case '|':
  case ')':
  case ']':
    throw PatternSyntaxError(
        atom_offset, "Unescaped special character '{}' at offset {}"sv,
        next_char, atom_offset);
  }
}

auto parse_factor(Cursor &cursor) -> Node {
  auto atom = parse_atom(cursor);
  if (cursor.is_at_end()) {
    return atom;
  }

  switch (cursor.peek()) {
  default:
    return atom;
  case '*':
    cursor.eat_next();
    if (cursor.try_eat('?')) {
      return quantify<quantifier::LazyStar>(std::move(atom));
    }
    return quantify<quantifier::Star>(std::move(atom));
  case '+':
    cursor.eat_next();
    if (cursor.try_eat('?')) {
      return quantify<quantifier::LazyPlus>(std::move(atom));
    }
    return quantify<quantifier::Plus>(std::move(atom));
  case '?':
    cursor.eat_next();
    if (cursor.try_eat('?')) {
      return quantify<quantifier::LazyQuestion>(std::move(atom));
    }
    return quantify<quantifier::Question>(std::move(atom));
  }
}

auto parse_sequence(Cursor &cursor) -> Node {
  std::vector<Node> nodes;
  while (not(cursor.is_next_or_end('|') || cursor.is_next_or_end(')'))) {
    nodes.push_back(parse_factor(cursor));
  }

  if (nodes.size() == 1) {
    return std::move(nodes.front());
  }
  return {Node::Sequence{std::move(nodes)}};
}

// Right associative: "a|b|c" is a|(b|c)
auto parse_alternation(Cursor &cursor) -> Node {
  auto left = parse_sequence(cursor);
  if (not cursor.try_eat('|')) {
    return left;
  }

  auto right = parse_alternation(cursor);
  return {Node::Alternation{box(std::move(left)), box(std::move(right))}};
}
} // namespace

auto bkregex::parse(std::string_view pattern) -> Node {
  Cursor cursor{.text = pattern, .offset = 0};
  auto root = parse_alternation(cursor);

  // Only an unbalanced ')' can stop the top level early
  if (not cursor.is_at_end()) {
    throw PatternSyntaxError(cursor.offset,
                             "Unexpected character '{}' at offset {}"sv,
                             cursor.peek(), cursor.offset);
  }
  return root;
}
