#include "regex_test_common.hpp"
#include "testing.hpp"

#include <utility>

using namespace std::literals;

TEST_CASE(linear, "[regex][matching]") {
  CHECK(does_match(R"(abc)", "abc"));
  CHECK(does_match(R"(a.c)", "axc"));
  CHECK(!does_match(R"(a.c)", "ac"));
  CHECK(!does_match(R"(..)", "abc"));
  CHECK(!does_match(R"(....)", "abc"));
  CHECK(does_match(R"(a(bc))", "abc"));
  CHECK(does_match(R"((a(b(c)d)e)f)", "abcdef"));
  CHECK(!does_match(R"(aec)", "abc"));
}

TEST_CASE(empty_pattern, "[regex][matching]") {
  CHECK(does_match("", ""));
  CHECK(!does_match("", "a"));
  CHECK(does_match("()", ""));
  CHECK(does_match("a|", ""));
  CHECK(does_match("a|", "a"));
  CHECK(!does_match("|", "x"));
}

TEST_CASE(dot_matches_anything, "[regex][matching]") {
  CHECK(does_match(".", "\n"));
  CHECK(does_match(".", "\r"));
  CHECK(does_match("...", "\0\t "sv));
  CHECK(!does_match(".", ""));
}

TEST_CASE(none_or_more, "[regex][matching]") {
  CHECK(does_match(R"(a*b)", "aaab"));
  CHECK(does_match(R"(a*b)", "b"));
  CHECK(does_match(R"(a*)", ""));
  CHECK(does_match(R"(a*a)", "aaa"));
  CHECK(does_match(R"(.*)", "abc"));
  CHECK(does_match(R"(.*.)", "abc"));
  CHECK(does_match(R"(a(b|c)*d)", "abcbcd"));
  CHECK(does_match(R"((ab?c)*)", "abcabc"));
  CHECK(does_match(R"((x|y)*(z|w)?)", "xyxz"));
  CHECK(!does_match(R"(.(.)*..)", "a"));
}

TEST_CASE(one_or_more, "[regex][matching]") {
  CHECK(does_match(R"(a+)", "aaaa"));
  CHECK(!does_match(R"(a+)", ""));
  CHECK(does_match(R"((ab)+)", "ababab"));
  CHECK(!does_match(R"((ab)+)", "abc"));
  CHECK(does_match(R"(a+b+c+)", "aaabbbccc"));
  CHECK(does_match(R"(a+ba+c)", "aaabaac"));
  CHECK(!does_match(R"(a+c)", "aaabaac"));
  CHECK(does_match(R"(a((b|c)d)+e)", "abdcde"));
  CHECK(!does_match(R"(a((b|c)d)+e)", "abcdcde"));
}

TEST_CASE(maybe, "[regex][matching]") {
  CHECK(does_match(R"(a?)", "a"));
  CHECK(does_match(R"(a?)", ""));
  CHECK(does_match(R"(a?b)", "b"));
  CHECK(does_match(R"(a?b?c?)", "abc"));
  CHECK(does_match(R"(colou?r)", "color"));
  CHECK(does_match(R"(colou?r)", "colour"));
  CHECK(!does_match(R"(colou?r)", "colouur"));
}

// Each repetition commits to the first way the repeated node can match, only
// the number of repetitions is backtracked over.
TEST_CASE(repetition_commits_to_first_candidate, "[regex][matching]") {
  CHECK(!does_match(R"((a|ab)*c)", "abc"));
  CHECK(does_match(R"((ab|a)*c)", "abc"));
  CHECK(does_match(R"((a|ab)(c|bcd)(d*))", "abcd"));
  CHECK(does_match(R"((a*)+b)", "aab"));
}

TEST_CASE(lazy_quantifiers, "[regex][matching]") {
  CHECK(does_match(R"(a*?b)", "aaab"));
  CHECK(does_match(R"(a*?)", ""));
  CHECK(does_match(R"(a+?)", "aaa"));
  CHECK(!does_match(R"(a+?)", ""));
  CHECK(does_match(R"(a??b)", "ab"));
  CHECK(does_match(R"(a??b)", "b"));

  // Lazy repetition backtracks into the repeated node as well
  CHECK(does_match(R"((a|ab)*?c)", "abc"));
}

TEST_CASE(either, "[regex][matching]") {
  CHECK(does_match(R"(a|b)", "a"));
  CHECK(does_match(R"(a|b)", "b"));
  CHECK(!does_match(R"(a|b)", "c"));
  CHECK(does_match(R"(abc|def)", "def"));
  CHECK(does_match(R"((ab|a)b)", "abb"));
  CHECK(does_match(R"((a|bc)d+)", "bcd"));
  CHECK(does_match(R"((ab|cd|ef)+)", "abcdefab"));
  CHECK(does_match(R"((a|b)(c|d)(e|f))", "bdf"));
  CHECK(does_match(R"(.*(dead|die).*)", "the dead sea"));
}

TEST_CASE(anchors, "[regex][matching]") {
  CHECK(does_match(R"(^abc$)", "abc"));
  CHECK(!does_match(R"(^abc$)", "xabc"));
  CHECK(does_match(R"(^a(bc)?d$)", "ad"));
  CHECK(!does_match(R"(^hello$)", "hello world"));
  CHECK(does_match(R"(^$)", ""));
  CHECK(does_match(R"($^)", ""));
  CHECK(!does_match(R"(a$b)", "ab"));
}

TEST_CASE(groups, "[regex][matching]") {
  CHECK(does_match(R"((?:ab)+)", "abab"));
  CHECK(does_match(R"((?:a|b)*c)", "abbac"));
  CHECK(!does_match(R"((?:ab)+)", "aba"));
}

TEST_CASE(lookaround, "[regex][matching]") {
  CHECK(does_match(R"(x(?=y)y)", "xy"));
  CHECK(!does_match(R"(x(?=y))", "xy"));
  CHECK(does_match(R"(x(?!y).)", "xz"));
  CHECK(!does_match(R"(x(?!y).)", "xy"));
  CHECK(does_match(R"(.(?<=b))", "b"));
  CHECK(!does_match(R"(.(?<!b))", "b"));
  CHECK(does_match(R"((?<!a)b)", "b"));
  CHECK(does_match(R"(ab(?<=a.))", "ab"));
}

TEST_CASE(reuse_compiled_pattern, "[regex][matching]") {
  auto const pattern = bkregex::Pattern{R"([xy]?z+)"};
  CHECK(pattern.match("zzzzz"));
  CHECK(pattern.match("xz"));
  CHECK(!pattern.match("xy"));
  CHECK(!pattern.match(""));
  CHECK(pattern.pattern() == R"([xy]?z+)");
}

TEST_CASE(moved_pattern, "[regex][matching]") {
  auto pattern = bkregex::Pattern{"ab+"};
  auto moved = std::move(pattern);
  CHECK(moved.match("abbb"));
  CHECK(moved.pattern() == "ab+");
}
