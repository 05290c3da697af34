#ifndef __TABBY_UNIX_SOCKET_HANDLER__
#define __TABBY_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace tabby {
/**
 * @brief SocketHandler over POSIX descriptors with a mutex per socket.
 *
 * All descriptors handed out are non-blocking; callers wait with
 * `waitForData` and deadlines are enforced by SocketHandler.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual bool waitForData(int fd, int64_t timeoutMs);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /** @brief Returns the mutex of a tracked socket, or null once closed. */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, close-on-exec).
   */
  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace tabby

#endif  // __TABBY_UNIX_SOCKET_HANDLER__
