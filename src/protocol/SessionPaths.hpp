#ifndef __TABBY_SESSION_PATHS__
#define __TABBY_SESSION_PATHS__

#include "Headers.hpp"

namespace tabby {
/**
 * Derives the coordinator's socket and pid file locations from a tmux session
 * id, so that the daemon and every renderer of one session agree on the
 * endpoint without any other coordination.
 *
 * Files live in the runtime directory, which is `TABBY_RUNTIME_DIR` when set
 * and the system temp directory otherwise.  Call \ref setRuntimeDirOverride to
 * pin it (tests do this).
 */
class SessionPaths {
 public:
  SessionPaths();

  void setRuntimeDirOverride(const string& dir);

  string getRuntimeDir() const;

  /** @brief `<runtime dir>/tabby-daemon-<session>.sock` */
  string socketPath(const string& sessionId) const;

  /** @brief `<runtime dir>/tabby-daemon-<session>.pid` */
  string pidPath(const string& sessionId) const;

  SocketEndpoint endpoint(const string& sessionId) const;

  /**
   * @brief Maps a session id to a file-name-safe form.  Empty maps to
   * `default`; characters outside `[A-Za-z0-9_.-]` become `_`.
   */
  static string sanitizeSessionId(const string& sessionId);

 private:
  optional<string> runtimeDirOverride;
};
}  // namespace tabby

#endif  // __TABBY_SESSION_PATHS__
