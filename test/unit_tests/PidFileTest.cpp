#include "PidFile.hpp"
#include "TestHeaders.hpp"

using namespace tabby;

namespace {
string makeTempDir() {
  string pattern = GetTempDirectory() + string("tabby_pid_XXXXXXXX");
  return string(mkdtemp(&pattern[0]));
}

void writeFile(const string& path, const string& contents) {
  ofstream out(path);
  out << contents;
}

pid_t deadPid() {
  pid_t child = fork();
  if (child == 0) {
    _exit(0);
  }
  int status;
  waitpid(child, &status, 0);
  return child;
}
}  // namespace

TEST_CASE("Claim and release a fresh pid file", "[PidFile]") {
  string dir = makeTempDir();
  PidFile pidFile(dir + "/tabby.pid");
  REQUIRE_FALSE(pidFile.exists());
  REQUIRE_FALSE(pidFile.readPid());

  pidFile.claim();
  REQUIRE(pidFile.exists());
  REQUIRE(*pidFile.readPid() == ::getpid());
  REQUIRE(pidFile.isOwnedByUs());

  REQUIRE(pidFile.release());
  REQUIRE_FALSE(pidFile.exists());
  REQUIRE_FALSE(pidFile.release());
  FATAL_FAIL(fs::remove_all(dir.c_str()));
}

TEST_CASE("Stale pid file is replaced", "[PidFile]") {
  string dir = makeTempDir();
  string path = dir + "/tabby.pid";

  SECTION("dead process") { writeFile(path, to_string(deadPid()) + "\n"); }
  SECTION("garbage") { writeFile(path, "not a pid"); }

  PidFile pidFile(path);
  pidFile.claim();
  REQUIRE(pidFile.isOwnedByUs());
  REQUIRE(pidFile.release());
  FATAL_FAIL(fs::remove_all(dir.c_str()));
}

TEST_CASE("Live holder blocks a second claim", "[PidFile]") {
  string dir = makeTempDir();
  string path = dir + "/tabby.pid";
  pid_t parent = ::getppid();
  writeFile(path, to_string(parent) + "\n");

  PidFile pidFile(path);
  REQUIRE(PidFile::processAlive(parent));
  REQUIRE_THROWS_WITH(pidFile.claim(), "daemon already running with pid " +
                                           to_string(parent));
  // Someone else's file is never removed
  REQUIRE_FALSE(pidFile.release());
  REQUIRE(pidFile.exists());
  FATAL_FAIL(fs::remove_all(dir.c_str()));
}

TEST_CASE("Claiming twice from the same process succeeds", "[PidFile]") {
  string dir = makeTempDir();
  PidFile pidFile(dir + "/tabby.pid");
  pidFile.claim();
  pidFile.claim();
  REQUIRE(pidFile.isOwnedByUs());
  REQUIRE(pidFile.release());
  FATAL_FAIL(fs::remove_all(dir.c_str()));
}

TEST_CASE("processAlive rejects non-positive pids", "[PidFile]") {
  REQUIRE_FALSE(PidFile::processAlive(0));
  REQUIRE_FALSE(PidFile::processAlive(-1));
  REQUIRE(PidFile::processAlive(::getpid()));
}
