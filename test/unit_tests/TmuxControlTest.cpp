#include "FakeSubprocessUtils.hpp"
#include "TestHeaders.hpp"
#include "TmuxControl.hpp"

using namespace tabby;

TEST_CASE("list-windows rows become windows", "[TmuxControl]") {
  shared_ptr<FakeSubprocessUtils> subprocess(new FakeSubprocessUtils());
  subprocess->setOutput("list-windows",
                        "@1\t0\t1\tmain\n"
                        "@2\t1\t0\tlogs\ttail\n"
                        "garbage\n"
                        "@3\tx\t0\tbad index\n"
                        "\n");
  TmuxControl tmux(subprocess);
  auto windows = tmux.listWindows("$0");
  REQUIRE(windows.size() == 2);
  REQUIRE(windows[0].id == "@1");
  REQUIRE(windows[0].index == 0);
  REQUIRE(windows[0].active);
  REQUIRE(windows[0].name == "main");
  REQUIRE(windows[1].id == "@2");
  REQUIRE_FALSE(windows[1].active);
  REQUIRE(windows[1].name == "logs\ttail");

  auto calls = subprocess->callsTo("list-windows");
  REQUIRE(calls.size() == 1);
  REQUIRE(calls[0][2] == "-t");
  REQUIRE(calls[0][3] == "$0");
}

TEST_CASE("Failed commands report false or nothing", "[TmuxControl]") {
  shared_ptr<FakeSubprocessUtils> subprocess(new FakeSubprocessUtils());
  subprocess->setOutput("list-windows", "@1\t0\t1\tmain\n");
  subprocess->setFailing("list-windows");
  subprocess->setFailing("select-window");
  subprocess->setFailing("display-message");
  TmuxControl tmux(subprocess);
  REQUIRE(tmux.listWindows("").empty());
  REQUIRE_FALSE(tmux.selectWindow("@1"));
  REQUIRE(tmux.currentPaneId() == "");
  REQUIRE(tmux.killWindow("@1"));
}

TEST_CASE("Commands are built without a shell", "[TmuxControl]") {
  shared_ptr<FakeSubprocessUtils> subprocess(new FakeSubprocessUtils());
  subprocess->setOutput("display-message", "%7\n");
  subprocess->setOutput("list-clients", "/dev/pts/3\n\n/dev/pts/4\n");
  TmuxControl tmux(subprocess);

  REQUIRE(tmux.currentPaneId() == "%7");
  REQUIRE(tmux.listClientTtys() ==
          vector<string>({"/dev/pts/3", "/dev/pts/4"}));
  REQUIRE_FALSE(tmux.selectPane(""));
  REQUIRE(tmux.newWindowAfter("@2"));
  REQUIRE(tmux.newWindowAfter(""));

  auto calls = subprocess->callsTo("new-window");
  REQUIRE(calls.size() == 2);
  REQUIRE(calls[0] == vector<string>({"tmux", "new-window", "-a", "-t", "@2"}));
  REQUIRE(calls[1] == vector<string>({"tmux", "new-window", "-a"}));
  // Empty pane id never reaches tmux
  REQUIRE(subprocess->callsTo("select-pane").empty());
}
