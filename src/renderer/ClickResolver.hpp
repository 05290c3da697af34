#ifndef __TABBY_CLICK_RESOLVER__
#define __TABBY_CLICK_RESOLVER__

#include "Headers.hpp"
#include "Protocol.hpp"

namespace tabby {
/**
 * @brief Maps a screen position to the region the last frame put there.
 */
class ClickResolver {
 public:
  /**
   * @brief First region, in storage order, containing content line
   * `contentLine` and column `x`.  An end column of 0 is read as `width`.
   */
  static optional<ClickableRegion> findRegion(
      const vector<ClickableRegion>& regions, int contentLine, int x,
      int width);

  /**
   * @brief True if column `x` falls in the rightmost `edgeZoneColumns` of a
   * surface `width` wide.  The zone is off when it is 0 or when the surface
   * is narrower than four zones.
   */
  static bool inEdgeZone(int x, int width, int edgeZoneColumns);

  /**
   * @brief Actions naming a window, pane or group, for which the edge zone
   * opens a menu.  Buttons such as new_window are excluded.
   */
  static bool isMenuCapableAction(const string& action);
};
}  // namespace tabby

#endif  // __TABBY_CLICK_RESOLVER__
