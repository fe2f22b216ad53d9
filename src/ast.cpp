#include "bkregex/ast.hpp"

#include <climits>
#include <format>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace bkregex;

namespace {
constexpr auto tag(Node::Literal const &) -> std::string_view {
  return "Literal";
}
constexpr auto tag(Node::Dot const &) -> std::string_view { return "Dot"; }
constexpr auto tag(Node::CharClass const &) -> std::string_view {
  return "CharClass";
}
constexpr auto tag(Node::Start const &) -> std::string_view { return "Start"; }
constexpr auto tag(Node::End const &) -> std::string_view { return "End"; }
constexpr auto tag(Node::Sequence const &) -> std::string_view {
  return "Sequence";
}
constexpr auto tag(Node::Alternation const &) -> std::string_view {
  return "Alternation";
}
constexpr auto tag(Node::NonCaptureGroup const &) -> std::string_view {
  return "NonCaptureGroup";
}

template <typename Kind>
constexpr auto tag(Node::Quantified<Kind> const &) -> std::string_view {
  return Kind::type;
}

template <typename Direction>
constexpr auto tag(Node::Lookaround<Direction> const &) -> std::string_view {
  return Direction::type;
}
} // namespace

auto bkregex::type_name(Node const &node) -> std::string_view {
  return std::visit([](auto const &type) { return tag(type); }, node.type);
}

auto bkregex::describe(Node const &node) -> std::string {
  return std::visit(
      Overload{
          [](Node::Literal const &literal) {
            return std::format("'{}'", literal.value);
          },
          [](Node::CharClass const &char_class) {
            std::string output = char_class.is_complement ? "[^" : "[";
            for (unsigned c = 0; c <= UCHAR_MAX; c += 1) {
              if (char_class.members.test(c)) {
                output.push_back(static_cast<char>(c));
              }
            }
            output += "]";
            return output;
          },
          []<typename Direction>(Node::Lookaround<Direction> const &look) {
            return std::string{look.is_positive ? "=" : "!"};
          },
          [](auto const &) { return std::string{}; },
      },
      node.type);
}

auto bkregex::children(Node const &node) -> std::vector<Node const *> {
  return std::visit(
      Overload{
          [](Node::Sequence const &sequence) {
            std::vector<Node const *> result;
            for (auto const &child : sequence.nodes) {
              result.push_back(&child);
            }
            return result;
          },
          [](Node::Alternation const &alternation) {
            return std::vector<Node const *>{alternation.left.get(),
                                             alternation.right.get()};
          },
          [](Node::NonCaptureGroup const &group) {
            return std::vector<Node const *>{group.child.get()};
          },
          []<typename Kind>(Node::Quantified<Kind> const &quantified) {
            return std::vector<Node const *>{quantified.child.get()};
          },
          []<typename Direction>(Node::Lookaround<Direction> const &look) {
            return std::vector<Node const *>{look.child.get()};
          },
          [](auto const &) { return std::vector<Node const *>{}; },
      },
      node.type);
}
