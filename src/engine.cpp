#include "private/evaluation.hpp"

#include "bkregex/ast.hpp"
#include "bkregex/trace.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <variant>

using namespace bkregex;
using namespace bkregex::evaluation;

namespace {
auto produce_node(Context const &context, Node::Literal const &literal,
                  size_t position, Candidates emit) -> Control {
  if (position < context.text.size() &&
      context.text[position] == literal.value) {
    return emit(position + 1);
  }
  return Control::next;
}

auto produce_node(Context const &context, Node::Dot const &, size_t position,
                  Candidates emit) -> Control {
  if (position < context.text.size()) {
    return emit(position + 1);
  }
  return Control::next;
}

auto produce_node(Context const &context, Node::CharClass const &char_class,
                  size_t position, Candidates emit) -> Control {
  if (position < context.text.size() &&
      char_class.contains(context.text[position]) !=
          char_class.is_complement) {
    return emit(position + 1);
  }
  return Control::next;
}

auto produce_node(Context const &, Node::Start const &, size_t position,
                  Candidates emit) -> Control {
  if (position == 0) {
    return emit(position);
  }
  return Control::next;
}

auto produce_node(Context const &context, Node::End const &, size_t position,
                  Candidates emit) -> Control {
  if (position == context.text.size()) {
    return emit(position);
  }
  return Control::next;
}

// Each end position of the first node restarts the remainder of the sequence,
// this is where backtracking happens.
auto produce_sequence(Context const &context, std::span<Node const> remaining,
                      size_t position, Candidates emit) -> Control {
  if (remaining.empty()) {
    return emit(position);
  }
  return produce(context, remaining.front(), position,
                 [&](size_t next_position) {
                   return produce_sequence(context, remaining.subspan(1),
                                           next_position, emit);
                 });
}

auto produce_node(Context const &context, Node::Sequence const &sequence,
                  size_t position, Candidates emit) -> Control {
  return produce_sequence(context, sequence.nodes, position, emit);
}

auto produce_node(Context const &context,
                  Node::Alternation const &alternation, size_t position,
                  Candidates emit) -> Control {
  if (produce(context, *alternation.left, position, emit) == Control::stop) {
    return Control::stop;
  }
  return produce(context, *alternation.right, position, emit);
}

auto produce_node(Context const &context, Node::NonCaptureGroup const &group,
                  size_t position, Candidates emit) -> Control {
  return produce(context, *group.child, position, emit);
}

// Commits to the first candidate of every further repetition. Stops once
// the child fails, or once a repetition consumed nothing (it would only offer
// the same position again).
auto repeat_greedily(Context const &context, Node const &child,
                     size_t position, Candidates emit) -> Control {
  size_t current_position = position;
  while (auto next_position =
             first_candidate(context, child, current_position)) {
    if (emit(*next_position) == Control::stop) {
      return Control::stop;
    }
    if (*next_position == current_position) {
      break;
    }
    current_position = *next_position;
  }
  return Control::next;
}

auto repeat_lazily(Context const &context, Node const &child, size_t position,
                   Candidates emit) -> Control {
  if (emit(position) == Control::stop) {
    return Control::stop;
  }
  return produce(context, child, position, [&](size_t middle) {
    if (middle == position) {
      // Recursing would restart this exact enumeration
      return Control::next;
    }
    return repeat_lazily(context, child, middle, emit);
  });
}

auto produce_node(Context const &context,
                  Node::Quantified<quantifier::Star> const &star,
                  size_t position, Candidates emit) -> Control {
  if (emit(position) == Control::stop) {
    return Control::stop;
  }
  return repeat_greedily(context, *star.child, position, emit);
}

auto produce_node(Context const &context,
                  Node::Quantified<quantifier::Plus> const &plus,
                  size_t position, Candidates emit) -> Control {
  Node const &child = *plus.child;
  return produce(context, child, position, [&](size_t first_position) {
    if (emit(first_position) == Control::stop) {
      return Control::stop;
    }
    return repeat_greedily(context, child, first_position, emit);
  });
}

auto produce_node(Context const &context,
                  Node::Quantified<quantifier::Question> const &question,
                  size_t position, Candidates emit) -> Control {
  if (emit(position) == Control::stop) {
    return Control::stop;
  }
  return produce(context, *question.child, position, emit);
}

auto produce_node(Context const &context,
                  Node::Quantified<quantifier::LazyStar> const &star,
                  size_t position, Candidates emit) -> Control {
  return repeat_lazily(context, *star.child, position, emit);
}

// The lazy tail starts by offering `middle` again, so every first repetition
// is reported twice. Harmless for matching, kept as is.
auto produce_node(Context const &context,
                  Node::Quantified<quantifier::LazyPlus> const &plus,
                  size_t position, Candidates emit) -> Control {
  Node const &child = *plus.child;
  return produce(context, child, position, [&](size_t middle) {
    if (emit(middle) == Control::stop) {
      return Control::stop;
    }
    return repeat_lazily(context, child, middle, emit);
  });
}

auto produce_node(Context const &context,
                  Node::Quantified<quantifier::LazyQuestion> const &question,
                  size_t position, Candidates emit) -> Control {
  if (emit(position) == Control::stop) {
    return Control::stop;
  }
  return produce(context, *question.child, position, emit);
}

auto produce_node(Context const &context,
                  Node::Lookaround<direction::Ahead> const &lookahead,
                  size_t position, Candidates emit) -> Control {
  bool const found =
      first_candidate(context, *lookahead.child, position).has_value();
  if (found == lookahead.is_positive) {
    return emit(position);
  }
  return Control::next;
}

// Tries every start position up to here, there is no reverse matching
auto produce_node(Context const &context,
                  Node::Lookaround<direction::Behind> const &lookbehind,
                  size_t position, Candidates emit) -> Control {
  bool found = false;
  for (size_t start = 0; start <= position && not found; start += 1) {
    produce(context, *lookbehind.child, start, [&](size_t end) {
      if (end != position) {
        return Control::next;
      }
      found = true;
      return Control::stop;
    });
  }

  if (found == lookbehind.is_positive) {
    return emit(position);
  }
  return Control::next;
}

auto produce_untraced(Context const &context, Node const &node,
                      size_t position, Candidates emit) -> Control {
  return std::visit(
      [&](auto const &type) {
        return produce_node(context, type, position, emit);
      },
      node.type);
}
} // namespace

auto evaluation::produce(Context const &context, Node const &node,
                         size_t position, Candidates emit) -> Control {
  if (context.observer == nullptr) {
    return produce_untraced(context, node, position, emit);
  }

  MatchObserver &observer = *context.observer;
  auto const node_type = type_name(node);
  observer.on_enter({
      .kind = TraceEvent::Kind::enter,
      .node_type = node_type,
      .position = position,
      .end = position,
  });

  auto const control =
      produce_untraced(context, node, position, [&](size_t end) {
        observer.on_candidate({
            .kind = TraceEvent::Kind::candidate,
            .node_type = node_type,
            .position = position,
            .end = end,
        });
        return emit(end);
      });

  if (control == Control::next) {
    observer.on_exit({
        .kind = TraceEvent::Kind::exit,
        .node_type = node_type,
        .position = position,
        .end = position,
    });
  }
  return control;
}

auto evaluation::first_candidate(Context const &context, Node const &node,
                                 size_t position) -> std::optional<size_t> {
  std::optional<size_t> result;
  produce(context, node, position, [&](size_t end) {
    result = end;
    return Control::stop;
  });
  return result;
}
