#ifndef __TABBY_SUBPROCESS_UTILS__
#define __TABBY_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Runs external programs without a shell and captures their stdout.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs `command args...`, waits for it and returns its stdout.
   *
   * stderr of the child goes to /dev/null so it never lands on a renderer's
   * terminal.
   * @param exitStatus Receives the exit code, or -1 if the child was killed.
   * @throws std::runtime_error if the child could not be started.
   */
  virtual string SubprocessToString(const string& command,
                                    const vector<string>& args,
                                    int* exitStatus = nullptr);
};
}  // namespace tabby

#endif  // __TABBY_SUBPROCESS_UTILS__
