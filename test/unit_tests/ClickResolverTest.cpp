#include "ClickResolver.hpp"
#include "TestHeaders.hpp"

using namespace tabby;

namespace {
ClickableRegion region(int startLine, int endLine, int startCol, int endCol,
                       const string& action, const string& target) {
  ClickableRegion r;
  r.startLine = startLine;
  r.endLine = endLine;
  r.startCol = startCol;
  r.endCol = endCol;
  r.action = action;
  r.target = target;
  return r;
}
}  // namespace

TEST_CASE("Overlapping regions resolve to the first stored",
          "[ClickResolver]") {
  vector<ClickableRegion> regions = {
      region(2, 2, 5, 8, "select_pane", "%1"),
      region(0, 10, 0, 0, "select_window", "@1"),
  };
  auto hit = ClickResolver::findRegion(regions, 2, 6, 30);
  REQUIRE(hit);
  REQUIRE(hit->target == "%1");

  // Outside the small one only the large one matches
  hit = ClickResolver::findRegion(regions, 2, 8, 30);
  REQUIRE(hit);
  REQUIRE(hit->target == "@1");

  // Storage order wins even when the larger region comes first
  std::reverse(regions.begin(), regions.end());
  hit = ClickResolver::findRegion(regions, 2, 6, 30);
  REQUIRE(hit->target == "@1");
}

TEST_CASE("End column 0 runs to the surface width", "[ClickResolver]") {
  vector<ClickableRegion> regions = {region(1, 3, 2, 0, "select_window", "@4")};
  REQUIRE(ClickResolver::findRegion(regions, 1, 29, 30));
  REQUIRE_FALSE(ClickResolver::findRegion(regions, 1, 30, 30));
  REQUIRE_FALSE(ClickResolver::findRegion(regions, 1, 1, 30));
  REQUIRE(ClickResolver::findRegion(regions, 3, 2, 30));
  REQUIRE_FALSE(ClickResolver::findRegion(regions, 4, 2, 30));
  REQUIRE_FALSE(ClickResolver::findRegion(regions, 0, 2, 30));
}

TEST_CASE("Explicit end column is exclusive", "[ClickResolver]") {
  vector<ClickableRegion> regions = {region(0, 0, 0, 12, "new_window", "")};
  REQUIRE(ClickResolver::findRegion(regions, 0, 11, 30));
  REQUIRE_FALSE(ClickResolver::findRegion(regions, 0, 12, 30));
  REQUIRE_FALSE(ClickResolver::findRegion({}, 0, 0, 30));
}

TEST_CASE("Edge zone covers the rightmost columns", "[ClickResolver]") {
  REQUIRE(ClickResolver::inEdgeZone(29, 30, 2));
  REQUIRE(ClickResolver::inEdgeZone(28, 30, 2));
  REQUIRE_FALSE(ClickResolver::inEdgeZone(27, 30, 2));
  REQUIRE_FALSE(ClickResolver::inEdgeZone(30, 30, 2));

  // Off when disabled or when the surface is too narrow
  REQUIRE_FALSE(ClickResolver::inEdgeZone(29, 30, 0));
  REQUIRE_FALSE(ClickResolver::inEdgeZone(6, 7, 2));
  REQUIRE(ClickResolver::inEdgeZone(7, 8, 2));
}

TEST_CASE("Only window, pane and group regions open menus",
          "[ClickResolver]") {
  REQUIRE(ClickResolver::isMenuCapableAction("select_window"));
  REQUIRE(ClickResolver::isMenuCapableAction("select_pane"));
  REQUIRE(ClickResolver::isMenuCapableAction("toggle_group"));
  REQUIRE_FALSE(ClickResolver::isMenuCapableAction("new_window"));
  REQUIRE_FALSE(ClickResolver::isMenuCapableAction("new_group"));
  REQUIRE_FALSE(ClickResolver::isMenuCapableAction(""));
}
