#ifndef __TABBY_CLIENT_CHANNEL__
#define __TABBY_CLIENT_CHANNEL__

#include "Headers.hpp"
#include "Protocol.hpp"
#include "SocketHandler.hpp"

namespace tabby {
/**
 * @brief Write side of one accepted renderer connection.
 *
 * Every frame written to the peer goes through `writeMutex`, so a render
 * from a broadcast and a menu from an input callback can never interleave
 * bytes.  The mutex also covers the render dedup hash and the sequence stamp,
 * which keeps sequence numbers in wire order for this peer.
 */
class ClientChannel {
 public:
  enum class RenderResult {
    SENT,
    DUPLICATE,
    // The provider's frame could not be encoded; the channel stays usable
    INVALID,
    FAILED,
  };

  ClientChannel(shared_ptr<SocketHandler> _socketHandler, int _fd,
                int64_t _writeTimeoutMs = SOCKET_WRITE_DEADLINE_MS);

  /** @brief Writes one envelope.  Returns false if the channel is unusable. */
  bool send(const Message& message);

  /**
   * @brief Writes a render frame unless its digest matches the last frame
   * this channel delivered.  A sequence number is drawn only when the frame
   * is actually written.
   */
  RenderResult sendRender(const string& clientId, RenderPayload payload,
                          uint64_t contentHash, atomic<uint64_t>* sequence);

  /**
   * @brief Forgets the last delivered frame so the next render is written
   * even if unchanged.  Called on every subscribe.
   */
  void resetDedup();

  /** @brief Marks the channel closed and releases the descriptor. */
  void close();

  /**
   * @brief True after a failed or timed out write.  A partially written
   * frame leaves the stream unframed, so the connection must be dropped.
   */
  bool isBroken() const { return broken; }

  int getFd() const { return fd; }

 protected:
  bool writeLocked(const Message& message);
  bool writeLineLocked(MessageType type, const string& line);

  shared_ptr<SocketHandler> socketHandler;
  int fd;
  int64_t writeTimeoutMs;
  mutex writeMutex;
  bool closed;
  atomic<bool> broken;
  optional<uint64_t> lastContentHash;
};
}  // namespace tabby

#endif  // __TABBY_CLIENT_CHANNEL__
