#include "bkregex/trace.hpp"

#include "bkregex/common.hpp"

#include <format>
#include <ostream>
#include <print>
#include <string>

using namespace bkregex;
using namespace std::string_view_literals;

auto TraceRecorder::on_enter(TraceEvent const &event) -> void {
  m_events.push_back(event);
}

auto TraceRecorder::on_candidate(TraceEvent const &event) -> void {
  m_events.push_back(event);
}

auto TraceRecorder::on_exit(TraceEvent const &event) -> void {
  m_events.push_back(event);
}

auto TraceRecorder::print(std::ostream &out_stream) const -> void {
  for (auto const &event : m_events) {
    std::println(out_stream, "{}", format_event(event));
  }
}

auto bkregex::format_event(TraceEvent const &event) -> std::string {
  switch (event.kind) {
  case TraceEvent::Kind::enter:
    return std::format("ENTER {} pos={}", event.node_type, event.position);
  case TraceEvent::Kind::candidate:
    return std::format("MATCH {} {}->{}", event.node_type, event.position,
                       event.end);
  case TraceEvent::Kind::exit:
    return std::format("EXIT {} pos={}", event.node_type, event.position);
  }
  throw RegexError("Unknown trace event kind {}"sv,
                   static_cast<int>(event.kind));
}
