#ifndef __TABBY_DAEMON_CREATOR__
#define __TABBY_DAEMON_CREATOR__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Detaches the coordinator from the tmux hook that launched it.
 *
 * The pid file is not written here: the server claims it after the fork so
 * that it always names the process that actually serves the socket.
 */
class DaemonCreator {
 public:
  /**
   * @brief Forks twice and redirects stdio to /dev/null.
   * @param terminateParent Whether the original process exits right away.
   * @return PARENT in the original process, CHILD in the daemon, -1 on
   * failure.
   */
  static int create(bool terminateParent);

  static const int PARENT = 1;
  static const int CHILD = 2;
};
}  // namespace tabby

#endif  // __TABBY_DAEMON_CREATOR__
