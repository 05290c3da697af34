#include "LineReader.hpp"
#include "TestHeaders.hpp"

using namespace tabby;

namespace {
void appendString(LineReader* reader, const string& s) {
  reader->append(s.data(), s.size());
}
}  // namespace

TEST_CASE("Frames split across reads", "[LineReader]") {
  LineReader reader;
  string line;
  appendString(&reader, "{\"type\":\"pi");
  REQUIRE_FALSE(reader.nextLine(&line));
  REQUIRE(reader.pendingBytes() == 11);

  appendString(&reader, "ng\"}\n{\"type\":\"pong\"}\r\npartial");
  REQUIRE(reader.nextLine(&line));
  REQUIRE(line == "{\"type\":\"ping\"}");
  REQUIRE(reader.nextLine(&line));
  REQUIRE(line == "{\"type\":\"pong\"}");
  REQUIRE_FALSE(reader.nextLine(&line));
  REQUIRE(reader.pendingBytes() == 7);
}

TEST_CASE("Empty frames are returned as empty lines", "[LineReader]") {
  LineReader reader;
  string line = "junk";
  appendString(&reader, "\n");
  REQUIRE(reader.nextLine(&line));
  REQUIRE(line.empty());
}

TEST_CASE("Oversized frame arriving in pieces is dropped", "[LineReader]") {
  LineReader reader(16);
  string line;
  appendString(&reader, "ok\n0123456789abcdefXYZ");
  REQUIRE(reader.droppedLines() == 1);
  REQUIRE(reader.nextLine(&line));
  REQUIRE(line == "ok");

  // The rest of the oversized frame is skipped through its newline
  appendString(&reader, "more of the same");
  appendString(&reader, "tail\nnext\n");
  REQUIRE(reader.nextLine(&line));
  REQUIRE(line == "next");
  REQUIRE_FALSE(reader.nextLine(&line));
  REQUIRE(reader.droppedLines() == 1);
}

TEST_CASE("Oversized frame in a single read is dropped", "[LineReader]") {
  LineReader reader(8);
  string line;
  appendString(&reader, "0123456789\nshort\n");
  REQUIRE(reader.nextLine(&line));
  REQUIRE(line == "short");
  REQUIRE(reader.droppedLines() == 1);
}

TEST_CASE("Frame exactly at the cap is kept", "[LineReader]") {
  LineReader reader(8);
  string line;
  appendString(&reader, "01234567\n");
  REQUIRE(reader.nextLine(&line));
  REQUIRE(line == "01234567");
  REQUIRE(reader.droppedLines() == 0);
}
