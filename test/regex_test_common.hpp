#pragma once

#include "bkregex/regex.hpp"
#include "testing.hpp"

#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

// Every query is also run with a trace recorder attached, observing a match
// must never change its outcome.

inline auto does_match(std::string_view regex, std::string_view string)
    -> bool {
  auto pattern = bkregex::Pattern{regex};
  bool const did_match = pattern.match(string);

  bkregex::TraceRecorder recorder;
  CHECK(pattern.match(string, recorder) == did_match);
  return did_match;
}

inline auto search(std::string_view regex, std::string_view string)
    -> std::optional<bkregex::Match> {
  auto pattern = bkregex::Pattern{regex};
  auto const result = pattern.search(string);

  bkregex::TraceRecorder recorder;
  CHECK(pattern.search(string, recorder) == result);
  return result;
}

inline auto findall(std::string_view regex, std::string_view string)
    -> std::vector<bkregex::Match> {
  auto pattern = bkregex::Pattern{regex};
  auto const result = pattern.findall(string);

  bkregex::TraceRecorder recorder;
  CHECK(pattern.findall(string, recorder) == result);
  return result;
}

inline auto matches(std::initializer_list<bkregex::Match> expected)
    -> std::vector<bkregex::Match> {
  return expected;
}
