#include "SessionPaths.hpp"
#include "TestHeaders.hpp"

using namespace tabby;

TEST_CASE("Session ids are sanitized for file names", "[SessionPaths]") {
  REQUIRE(SessionPaths::sanitizeSessionId("") == "default");
  REQUIRE(SessionPaths::sanitizeSessionId("$1") == "_1");
  REQUIRE(SessionPaths::sanitizeSessionId("work-2.a_b") == "work-2.a_b");
  REQUIRE(SessionPaths::sanitizeSessionId("../etc") == ".._etc");
}

TEST_CASE("Socket and pid paths share the runtime dir", "[SessionPaths]") {
  SessionPaths paths;
  paths.setRuntimeDirOverride("/run/user/1000/");
  REQUIRE(paths.getRuntimeDir() == "/run/user/1000");
  REQUIRE(paths.socketPath("$3") == "/run/user/1000/tabby-daemon-_3.sock");
  REQUIRE(paths.pidPath("$3") == "/run/user/1000/tabby-daemon-_3.pid");
  REQUIRE(paths.endpoint("$3").name() == paths.socketPath("$3"));
  REQUIRE(paths.socketPath("") == "/run/user/1000/tabby-daemon-default.sock");
}
