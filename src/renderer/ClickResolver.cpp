#include "ClickResolver.hpp"

namespace tabby {
namespace {
const set<string> MENU_CAPABLE_ACTIONS = {
    "select_window",
    "select_pane",
    "toggle_group",
};
}

optional<ClickableRegion> ClickResolver::findRegion(
    const vector<ClickableRegion>& regions, int contentLine, int x,
    int width) {
  for (const auto& region : regions) {
    if (contentLine < region.startLine || contentLine > region.endLine) {
      continue;
    }
    int endCol = region.endCol == 0 ? width : region.endCol;
    if (x >= region.startCol && x < endCol) {
      return region;
    }
  }
  return nullopt;
}

bool ClickResolver::inEdgeZone(int x, int width, int edgeZoneColumns) {
  if (edgeZoneColumns <= 0 || width < edgeZoneColumns * 4) {
    return false;
  }
  return x >= width - edgeZoneColumns && x < width;
}

bool ClickResolver::isMenuCapableAction(const string& action) {
  return MENU_CAPABLE_ACTIONS.find(action) != MENU_CAPABLE_ACTIONS.end();
}
}  // namespace tabby
