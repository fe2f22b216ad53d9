#include "bkregex/regex.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <print>
#include <span>
#include <string_view>
#include <vector>

using namespace std::literals;

namespace {
enum class Mode {
  match,
  search,
  findall,
  all,
};

struct Options {
  bool show_graph = false;
  bool show_trace = false;
  Mode mode = Mode::all;
  std::string_view pattern;
  std::string_view text;
};

constexpr int exit_syntax_error = 1;
constexpr int exit_usage_error = 2;

auto print_usage() -> void {
  std::println(std::cerr, "Usage: bkregex-cli [--graph] [--trace] "
                          "[--mode=match|search|findall|all] <pattern> <text>");
}

auto parse_mode(std::string_view name) -> std::optional<Mode> {
  if (name == "match") {
    return Mode::match;
  }
  if (name == "search") {
    return Mode::search;
  }
  if (name == "findall") {
    return Mode::findall;
  }
  if (name == "all") {
    return Mode::all;
  }
  return std::nullopt;
}

auto parse_options(std::span<char *> arguments) -> std::optional<Options> {
  Options options;
  std::vector<std::string_view> positional;
  for (std::string_view argument : arguments) {
    if (argument == "--graph") {
      options.show_graph = true;
    } else if (argument == "--trace") {
      options.show_trace = true;
    } else if (argument.starts_with("--mode=")) {
      auto mode = parse_mode(argument.substr("--mode="sv.size()));
      if (not mode.has_value()) {
        std::println(std::cerr, "Unknown mode '{}'", argument);
        return std::nullopt;
      }
      options.mode = *mode;
    } else if (argument.starts_with("--")) {
      std::println(std::cerr, "Unknown option '{}'", argument);
      return std::nullopt;
    } else {
      positional.push_back(argument);
    }
  }

  if (positional.size() != 2) {
    return std::nullopt;
  }
  options.pattern = positional[0];
  options.text = positional[1];
  return options;
}

auto summarize_trace(bkregex::TraceRecorder &recorder) -> void {
  recorder.print(std::cerr);
  recorder.clear();
}

auto run(Options const &options) -> void {
  auto const pattern = bkregex::Pattern{options.pattern};
  if (options.show_graph) {
    pattern.visualize(std::cout);
  }

  bkregex::TraceRecorder recorder;
  auto const want = [&](Mode mode) {
    return options.mode == mode || options.mode == Mode::all;
  };

  if (want(Mode::match)) {
    bool const did_match = options.show_trace
                               ? pattern.match(options.text, recorder)
                               : pattern.match(options.text);
    std::println("match: {}", did_match);
    summarize_trace(recorder);
  }

  if (want(Mode::search)) {
    auto const result = options.show_trace
                            ? pattern.search(options.text, recorder)
                            : pattern.search(options.text);
    if (result.has_value()) {
      std::println("search: ({}, {}) '{}'", result->start, result->end,
                   options.text.substr(result->start, result->size()));
    } else {
      std::println("search: None");
    }
    summarize_trace(recorder);
  }

  if (want(Mode::findall)) {
    auto const results = options.show_trace
                             ? pattern.findall(options.text, recorder)
                             : pattern.findall(options.text);
    std::println("findall: {} match(es)", results.size());
    for (auto const &result : results) {
      std::println("  ({}, {}) '{}'", result.start, result.end,
                   options.text.substr(result.start, result.size()));
    }
    summarize_trace(recorder);
  }
}
} // namespace

int main(int argc, char *argv[]) {
  auto options = parse_options(std::span{argv + 1, argv + argc});
  if (not options.has_value()) {
    print_usage();
    return exit_usage_error;
  }

  try {
    run(*options);
  } catch (bkregex::PatternSyntaxError const &error) {
    std::println(std::cerr, "Invalid pattern: {}", error.what());
    return exit_syntax_error;
  }
  return EXIT_SUCCESS;
}
