#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <prereader/text.hpp>

using namespace prereader;

TEST_CASE("trim strips surrounding whitespace only") {
    REQUIRE(text::trim("  a b \t") == "a b");
    REQUIRE(text::trim("\r\n\v\f") == "");
    REQUIRE(text::trim("") == "");
    REQUIRE(text::trim("x") == "x");
}

TEST_CASE("blank means empty or all whitespace") {
    REQUIRE(text::is_blank(""));
    REQUIRE(text::is_blank(" \t "));
    REQUIRE_FALSE(text::is_blank(" . "));
}

TEST_CASE("substring predicates") {
    REQUIRE(text::starts_with("#include", "#"));
    REQUIRE_FALSE(text::starts_with("#", "##"));
    REQUIRE(text::ends_with("line \\", "\\"));
    REQUIRE_FALSE(text::ends_with("a", "ba"));
    REQUIRE(text::contains("foo TODO bar", "TODO"));
    REQUIRE_FALSE(text::contains("foo", "oof"));
}

TEST_CASE("empty needle matches everything") {
    REQUIRE(text::contains("abc", ""));
    REQUIRE(text::starts_with("", ""));
    REQUIRE(text::ends_with("abc", ""));
}
