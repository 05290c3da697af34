#ifndef __TABBY_PIPE_SOCKET_HANDLER__
#define __TABBY_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace tabby {
/**
 * @brief Handles UNIX domain stream sockets addressed by filesystem path.
 *
 * The endpoint name is the socket path.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket at the endpoint name.
   * @return fd of the connected socket, or -1 with errno set.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Replaces any stale socket file at the path and starts listening.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Closes the listening fd.  The socket file itself is left alone;
   * whoever owns the path decides when to unlink it.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace tabby

#endif  // __TABBY_PIPE_SOCKET_HANDLER__
