#ifndef __TABBY_RENDERER_CONNECTION__
#define __TABBY_RENDERER_CONNECTION__

#include "Headers.hpp"
#include "LineReader.hpp"
#include "Protocol.hpp"
#include "SocketHandler.hpp"

namespace tabby {
/**
 * @brief A renderer's session with the coordinator.
 *
 * `connect` dials with a bounded number of attempts.  Once connected, a
 * receive thread decodes frames and hands them to the message callback; it
 * exits on EOF or a read error, which is how the owner learns the session is
 * gone.  All writes go through one send mutex so keep-alive pings never
 * interleave with input frames.
 */
class RendererConnection {
 public:
  typedef function<void(const Message&)> MessageCallback;

  RendererConnection(shared_ptr<SocketHandler> _socketHandler,
                     const SocketEndpoint& _endpoint, int _connectAttempts,
                     int _connectBackoffMs);
  virtual ~RendererConnection();

  /**
   * @brief Dials up to `connectAttempts` times, sleeping `connectBackoffMs`
   * between attempts.
   * @return false if every attempt failed.
   */
  bool connect(MessageCallback onMessage);

  bool isConnected() const { return connected; }

  /**
   * @brief Writes one envelope with the usual write deadline.  A failed write
   * marks the session disconnected.
   */
  bool send(const Message& message);

  /** @brief Stops the receive thread and closes the socket.  Idempotent. */
  void close();

  /** @brief Attempts made by the most recent `connect` call. */
  int getLastAttemptCount() const { return lastAttemptCount; }

 protected:
  void receiveLoop(int fd);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  int connectAttempts;
  int connectBackoffMs;
  int lastAttemptCount;

  mutex sendMutex;
  int socketFd;
  atomic<bool> connected;
  atomic<bool> halt;
  MessageCallback onMessage;
  shared_ptr<thread> receiveThread;
};
}  // namespace tabby

#endif  // __TABBY_RENDERER_CONNECTION__
