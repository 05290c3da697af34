#include "SubprocessUtils.hpp"
#include "TestHeaders.hpp"

using namespace tabby;

TEST_CASE("SubprocessToString captures stdout", "[SubprocessUtils]") {
  SubprocessUtils utils;
  int status = -1;
  string result = utils.SubprocessToString("printf", {"test123"}, &status);

  REQUIRE(result == "test123");
  REQUIRE(status == 0);
}

TEST_CASE("SubprocessToString passes arguments without a shell",
          "[SubprocessUtils]") {
  SubprocessUtils utils;
  string result = utils.SubprocessToString("echo", {"a b", "$HOME"});
  REQUIRE(result == "a b $HOME\n");
}

TEST_CASE("SubprocessToString reports the exit status", "[SubprocessUtils]") {
  SubprocessUtils utils;
  int status = 0;
  utils.SubprocessToString("false", {}, &status);
  REQUIRE(status == 1);

  utils.SubprocessToString("tabby-no-such-binary", {}, &status);
  REQUIRE(status == 127);
}
