#include "TestHeaders.hpp"

using namespace tabby;

TEST_CASE("split keeps empty middle fields", "[StringUtils]") {
  auto fields = split("@1\t0\t\tmain", '\t');
  REQUIRE(fields.size() == 4);
  REQUIRE(fields[0] == "@1");
  REQUIRE(fields[2] == "");
  REQUIRE(fields[3] == "main");
}

TEST_CASE("split drops one trailing delimiter", "[StringUtils]") {
  auto lines = split("a\nb\n", '\n');
  REQUIRE(lines.size() == 2);
  REQUIRE(split("", '\n').empty());
}

TEST_CASE("trimRight and trimSpace", "[StringUtils]") {
  REQUIRE(trimRight("abc   ") == "abc");
  REQUIRE(trimRight("   ") == "");
  REQUIRE(trimRight("abc\t ", " \t") == "abc");
  REQUIRE(trimRight("  abc") == "  abc");
  REQUIRE(trimSpace("\n  two words \r\n") == "two words");
  REQUIRE(trimSpace(" \t ") == "");
}
