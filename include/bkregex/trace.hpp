#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace bkregex {
struct TraceEvent {
  enum class Kind {
    enter,
    candidate,
    exit,
  };

  Kind kind;
  std::string_view node_type;
  size_t position;
  // Only meaningful for candidates, equal to `position` otherwise
  size_t end;
};

// Notified as the matcher walks the pattern tree. A node reports `enter`
// before it enumerates, one `candidate` per end position it offers, and
// `exit` once its enumeration is exhausted. A node whose consumer stops early
// never reports `exit`.
class MatchObserver {
public:
  virtual ~MatchObserver() = default;

  virtual auto on_enter(TraceEvent const &) -> void = 0;
  virtual auto on_candidate(TraceEvent const &) -> void = 0;
  virtual auto on_exit(TraceEvent const &) -> void = 0;
};

class TraceRecorder : public MatchObserver {
  std::vector<TraceEvent> m_events;

public:
  auto on_enter(TraceEvent const &) -> void override;
  auto on_candidate(TraceEvent const &) -> void override;
  auto on_exit(TraceEvent const &) -> void override;

  [[nodiscard]] auto events() const -> std::vector<TraceEvent> const & {
    return m_events;
  }
  auto clear() -> void { m_events.clear(); }

  // One line per event, see `format_event`
  auto print(std::ostream &) const -> void;
};

// "ENTER Star pos=0", "MATCH Literal 0->1" or "EXIT Star pos=0"
auto format_event(TraceEvent const &) -> std::string;
} // namespace bkregex
