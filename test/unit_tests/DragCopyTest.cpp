#include "DragCopy.hpp"
#include "FakeSubprocessUtils.hpp"
#include "TestHeaders.hpp"

using namespace tabby;

namespace {
const string FRAME =
    "\x1b[1mhello world\x1b[0m   \n"
    "second line\n"
    "   \n"
    "third";
}

TEST_CASE("Selection across lines", "[DragCopy]") {
  REQUIRE(DragCopy::extractText(FRAME, 0, 6, 0, 5, 1) == "world\nsecond");
  // Dragging backwards selects the same span
  REQUIRE(DragCopy::extractText(FRAME, 0, 5, 1, 6, 0) == "world\nsecond");
}

TEST_CASE("Selection on one line is inclusive", "[DragCopy]") {
  REQUIRE(DragCopy::extractText(FRAME, 0, 0, 3, 4, 3) == "third");
  REQUIRE(DragCopy::extractText(FRAME, 0, 4, 3, 0, 3) == "third");
  REQUIRE(DragCopy::extractText(FRAME, 0, 2, 0, 2, 0) == "l");
}

TEST_CASE("Scroll offset maps screen rows to content", "[DragCopy]") {
  REQUIRE(DragCopy::extractText(FRAME, 1, 0, 0, 5, 0) == "second");
}

TEST_CASE("Blank and out of range selections are empty", "[DragCopy]") {
  REQUIRE(DragCopy::extractText(FRAME, 0, 0, 2, 10, 2) == "");
  REQUIRE(DragCopy::extractText(FRAME, 0, 0, 7, 10, 9) == "");
  REQUIRE(DragCopy::extractText("", 0, 0, 0, 10, 0) == "");
  // Clamped to the last line
  REQUIRE(DragCopy::extractText(FRAME, 0, 0, 3, 2, 20) == "thi");
}

TEST_CASE("OSC 52 wraps base64 text", "[DragCopy]") {
  REQUIRE(DragCopy::osc52("hi") == "\x1b]52;c;aGk=\x07");
}

TEST_CASE("Copy fills the paste buffer and every client tty", "[DragCopy]") {
  string pattern = GetTempDirectory() + string("tabby_copy_XXXXXXXX");
  string dir = string(mkdtemp(&pattern[0]));
  string tty = dir + "/tty";
  {
    ofstream touch(tty);
  }

  shared_ptr<FakeSubprocessUtils> subprocess(new FakeSubprocessUtils());
  subprocess->setOutput("list-clients", tty + "\n" + dir + "/gone\n");
  shared_ptr<TmuxControl> tmux(new TmuxControl(subprocess));
  DragCopy dragCopy(tmux);

  REQUIRE(dragCopy.copy("world\nsecond") == 2);

  auto setBuffer = subprocess->callsTo("set-buffer");
  REQUIRE(setBuffer.size() == 1);
  REQUIRE(setBuffer[0] ==
          vector<string>({"tmux", "set-buffer", "--", "world\nsecond"}));

  auto message = subprocess->callsTo("display-message");
  REQUIRE(message.size() == 1);
  REQUIRE(message[0].back() == "Copied 2 lines");

  ifstream in(tty);
  string written((std::istreambuf_iterator<char>(in)),
                 std::istreambuf_iterator<char>());
  REQUIRE(written == DragCopy::osc52("world\nsecond"));

  // Nothing to copy, nothing run
  subprocess->clearCalls();
  REQUIRE(dragCopy.copy("") == 0);
  REQUIRE(subprocess->getCalls().empty());
  FATAL_FAIL(fs::remove_all(dir.c_str()));
}

TEST_CASE("Copy survives a failing tmux", "[DragCopy]") {
  shared_ptr<FakeSubprocessUtils> subprocess(new FakeSubprocessUtils());
  subprocess->setFailing("set-buffer");
  subprocess->setFailing("list-clients");
  shared_ptr<TmuxControl> tmux(new TmuxControl(subprocess));
  DragCopy dragCopy(tmux);
  REQUIRE(dragCopy.copy("x") == 1);
  REQUIRE(subprocess->callsTo("display-message").size() == 1);
}
