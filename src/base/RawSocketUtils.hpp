#ifndef __TABBY_RAW_SOCKET_UTILS__
#define __TABBY_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Blocking writes to plain descriptors (the console, tty devices).
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN.
   * @throws std::runtime_error if the descriptor is closed or fails.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Opens `path` for writing, writes `data` and closes it again.
   * @return false if the device could not be opened or written.
   */
  static bool writeToPath(const string& path, const string& data);
};
}  // namespace tabby
#endif  // __TABBY_RAW_SOCKET_UTILS__
