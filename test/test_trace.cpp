#include "bkregex/regex.hpp"
#include "bkregex/trace.hpp"
#include "testing.hpp"

#include <cstddef>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace std::literals;

namespace {
auto formatted(bkregex::TraceRecorder const &recorder)
    -> std::vector<std::string> {
  std::vector<std::string> lines;
  for (auto const &event : recorder.events()) {
    lines.push_back(bkregex::format_event(event));
  }
  return lines;
}

auto lines(std::initializer_list<std::string> expected)
    -> std::vector<std::string> {
  return expected;
}

struct BalanceObserver : bkregex::MatchObserver {
  size_t enters = 0;
  size_t candidates = 0;
  size_t exits = 0;

  auto on_enter(bkregex::TraceEvent const &) -> void override { enters += 1; }
  auto on_candidate(bkregex::TraceEvent const &) -> void override {
    candidates += 1;
  }
  auto on_exit(bkregex::TraceEvent const &) -> void override { exits += 1; }
};
} // namespace

TEST_CASE(trace_alternation, "[regex][trace]") {
  auto const pattern = bkregex::Pattern{"a|b"};
  bkregex::TraceRecorder recorder;
  CHECK(pattern.match("b", recorder));

  // Stopping at the first full match abandons the enclosing enumerations
  CHECK(formatted(recorder) == lines({
                                   "ENTER Alternation pos=0",
                                   "ENTER Literal pos=0",
                                   "EXIT Literal pos=0",
                                   "ENTER Literal pos=0",
                                   "MATCH Literal 0->1",
                                   "MATCH Alternation 0->1",
                               }));
}

TEST_CASE(trace_exhausted_sequence, "[regex][trace]") {
  auto const pattern = bkregex::Pattern{"ab"};
  bkregex::TraceRecorder recorder;
  CHECK(!pattern.match("ac", recorder));

  CHECK(formatted(recorder) == lines({
                                   "ENTER Sequence pos=0",
                                   "ENTER Literal pos=0",
                                   "MATCH Literal 0->1",
                                   "ENTER Literal pos=1",
                                   "EXIT Literal pos=1",
                                   "EXIT Literal pos=0",
                                   "EXIT Sequence pos=0",
                               }));
}

TEST_CASE(trace_event_fields, "[regex][trace]") {
  auto const pattern = bkregex::Pattern{"x*"};
  bkregex::TraceRecorder recorder;
  auto const result = pattern.search("", recorder);
  REQUIRE(result.has_value());

  auto const &events = recorder.events();
  REQUIRE(events.size() == 2);
  CHECK(events[0].kind == bkregex::TraceEvent::Kind::enter);
  CHECK(events[0].node_type == "Star");
  CHECK(events[0].position == 0);
  CHECK(events[1].kind == bkregex::TraceEvent::Kind::candidate);
  CHECK(events[1].end == 0);
}

TEST_CASE(trace_balanced_when_exhausted, "[regex][trace]") {
  // Nothing matches anywhere and nothing asks for a single candidate, so
  // every enumeration runs to completion
  auto const pattern = bkregex::Pattern{"(?:ab|ba)c"};
  BalanceObserver observer;
  CHECK(pattern.findall("abab ba", observer).empty());
  CHECK(observer.enters > 0);
  CHECK(observer.enters == observer.exits);
}

TEST_CASE(trace_print, "[regex][trace]") {
  auto const pattern = bkregex::Pattern{"q"};
  bkregex::TraceRecorder recorder;
  CHECK(!pattern.search("z", recorder).has_value());

  std::stringstream output;
  recorder.print(output);
  CHECK(output.str() == "ENTER Literal pos=0\n"
                        "EXIT Literal pos=0\n"
                        "ENTER Literal pos=1\n"
                        "EXIT Literal pos=1\n");

  recorder.clear();
  CHECK(recorder.events().empty());
}

TEST_CASE(visualize_graph, "[regex][visualize]") {
  auto const pattern = bkregex::Pattern{"a|[^bc]"};
  std::stringstream output;
  pattern.visualize(output);

  CHECK(output.str() == "digraph {\n"
                        "  node_0 [label=\"Alternation\"]\n"
                        "  node_0 -> node_1\n"
                        "  node_1 [label=\"Literal('a')\"]\n"
                        "  node_0 -> node_2\n"
                        "  node_2 [label=\"CharClass([^bc])\"]\n"
                        "}\n");
}

TEST_CASE(visualize_escapes_labels, "[regex][visualize]") {
  auto const pattern = bkregex::Pattern{R"(("|\\)+)"};
  std::stringstream output;
  pattern.visualize(output);

  auto const graph = output.str();
  CHECK(graph.contains(R"(node_0 [label="Plus"])"));
  CHECK(graph.contains(R"x([label="Literal('\"')"])x"));
  CHECK(graph.contains(R"x([label="Literal('\\')"])x"));
  CHECK(graph.contains("node_1 -> node_3"));
}
