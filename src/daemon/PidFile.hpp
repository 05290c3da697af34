#ifndef __TABBY_PID_FILE__
#define __TABBY_PID_FILE__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Single-instance guard for one coordinator session.
 *
 * A pid file naming a live process blocks a second instance.  A pid file
 * naming a dead process is stale and is replaced.  On shutdown the file is
 * only removed while it still names this process, so an exiting instance can
 * never delete the files of the instance that replaced it.
 */
class PidFile {
 public:
  explicit PidFile(const string& _path);

  /**
   * @brief Claims the file for the calling process.
   * @throws std::runtime_error "daemon already running with pid N" if a live
   * process other than us holds it, or if the file cannot be written.
   */
  void claim();

  /** @brief Removes the file if it still names this process. */
  bool release();

  /** @brief pid stored in the file, if it exists and parses. */
  optional<pid_t> readPid() const;

  /** @brief True if the file exists and names this process. */
  bool isOwnedByUs() const;

  bool exists() const;

  const string& getPath() const { return path; }

  /** @brief Zero-signal liveness probe. */
  static bool processAlive(pid_t pid);

 protected:
  string path;
};
}  // namespace tabby

#endif  // __TABBY_PID_FILE__
