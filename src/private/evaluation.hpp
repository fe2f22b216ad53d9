#pragma once

#include "bkregex/ast.hpp"
#include "bkregex/trace.hpp"
#include "private/function_ref.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace bkregex::evaluation {
enum class Control {
  next,
  stop,
};

// Receives the end position of each candidate in order. Returning
// Control::stop abandons the rest of the enumeration.
using Candidates = FunctionRef<Control(size_t)>;

struct Context {
  std::string_view text;
  MatchObserver *observer;
};

// Enumerates every position at which `node` can finish matching when started
// at `position`. Returns Control::stop iff the consumer stopped early. Nothing
// is cached between calls.
auto produce(Context const &, Node const &, size_t position, Candidates)
    -> Control;

auto first_candidate(Context const &, Node const &, size_t position)
    -> std::optional<size_t>;
} // namespace bkregex::evaluation
