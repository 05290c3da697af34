#ifndef __TABBY_SOCKET_HANDLER__
#define __TABBY_SOCKET_HANDLER__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   */
  virtual bool waitForData(int fd, int64_t timeoutMs) = 0;
  /**
   * @brief Reads up to count bytes from fd without blocking.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd without blocking.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Writes every byte before `timeoutMs` elapses.
   * @throws std::runtime_error when the deadline passes or the peer is gone.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count,
                       int64_t timeoutMs);

  /**
   * @brief Writes one newline-terminated frame under a single deadline.
   */
  void writeLine(int fd, const string& line, int64_t timeoutMs);

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Returns the listening fds for the endpoint.
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace tabby

#endif  // __TABBY_SOCKET_HANDLER__
