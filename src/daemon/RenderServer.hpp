#ifndef __TABBY_RENDER_SERVER__
#define __TABBY_RENDER_SERVER__

#include "ClientChannel.hpp"
#include "Headers.hpp"
#include "LineReader.hpp"
#include "PidFile.hpp"
#include "Protocol.hpp"
#include "SocketHandler.hpp"

namespace tabby {
/** @brief Registry view of one subscribed renderer, without its connection. */
struct ClientInfo {
  string clientId;
  int width = 80;
  int height = 24;
  int viewportOffset = 0;
  ColorProfile colorProfile = ColorProfile::ANSI256;
  string paneId;
};

/**
 * @brief The coordinator's side of the renderer protocol.
 *
 * Owns the session socket and pid file, one handler thread per accepted
 * connection, and the registry of subscribed renderers keyed by client id
 * (`@3` for a window sidebar, `header:%7` for a pane header).  All domain
 * state stays with the content provider, reached through the callbacks.
 *
 * Callbacks run on connection threads, possibly several at once for
 * different clients, and must be installed before `start()`.  An exception
 * escaping a callback is logged and dropped; it never ends the connection.
 *
 * The registry lock is never held across a callback or a socket write.
 */
class RenderServer {
 public:
  typedef function<void(const string& clientId, const string& paneId)>
      ConnectCallback;
  typedef function<void(const string& clientId)> DisconnectCallback;
  typedef function<void(const string& clientId, const InputPayload& input)>
      InputCallback;
  typedef function<void(const string& clientId, int width, int height,
                        const string& paneId)>
      ResizeCallback;
  typedef function<optional<RenderPayload>(const string& clientId, int width,
                                           int height)>
      RenderCallback;

  RenderServer(shared_ptr<SocketHandler> _socketHandler,
               const SocketEndpoint& _endpoint, const string& pidPath);
  virtual ~RenderServer();

  void setOnConnect(ConnectCallback cb) { onConnect = cb; }
  void setOnDisconnect(DisconnectCallback cb) { onDisconnect = cb; }
  void setOnInput(InputCallback cb) { onInput = cb; }
  void setOnResize(ResizeCallback cb) { onResize = cb; }
  void setOnRenderNeeded(RenderCallback cb) { onRenderNeeded = cb; }

  /**
   * @brief Claims the pid file, binds the socket and starts accepting.
   * @throws std::runtime_error if another live instance holds the session or
   * the socket cannot be bound.
   */
  void start();

  /**
   * @brief Closes every connection and stops accepting.  Socket and pid
   * files are removed only while the pid file still names this process.
   * Must not be called from a callback.
   */
  void stop();

  bool isRunning();

  /** @brief Re-renders every subscribed client. */
  void broadcastRender();

  /**
   * @brief Re-renders only the client whose id equals `activeId`.  Used for
   * animation ticks where hidden surfaces need no update.
   */
  void renderActiveWindowOnly(const string& activeId);

  /**
   * @brief Asks the provider for a frame and writes it unless it duplicates
   * the last frame this client received.
   */
  void sendRenderToClient(const string& clientId);

  /** @brief Pushes a context menu.  False if the client is gone. */
  bool sendMenuToClient(const string& clientId, const MenuPayload& menu);

  /** @brief Lowest color tier across clients, ANSI256 when there are none. */
  ColorProfile getMinColorProfile();

  size_t clientCount();
  vector<string> getAllClientIds();
  optional<ClientInfo> getClientInfo(const string& clientId);

  /** @brief Records a size learned outside the protocol (e.g. from tmux). */
  void updateClientSize(const string& clientId, int width, int height);

  /** @brief Last sequence number stamped on a frame; 0 before the first. */
  uint64_t lastSequenceNumber() const { return sequenceNumber; }

  /**
   * @brief True while the pid file names us and the socket file exists.
   * The daemon exits once this turns false.
   */
  bool ownsSessionFiles();

  const SocketEndpoint& getEndpoint() const { return endpoint; }

  /** @brief Digest used for render dedup. */
  static uint64_t hashContent(const RenderPayload& payload);

 protected:
  struct ClientRecord {
    ClientInfo info;
    shared_ptr<ClientChannel> channel;
  };

  struct ConnectionThread {
    shared_ptr<thread> handle;
    shared_ptr<atomic<bool>> done;
  };

  void acceptLoop();
  void reapConnectionThreads();
  void handleConnection(int fd, shared_ptr<atomic<bool>> done);
  /** @return false when the connection should be closed. */
  bool handleMessage(const shared_ptr<ClientChannel>& channel,
                     const Message& message, string* clientId);
  void registerClient(const shared_ptr<ClientChannel>& channel,
                      const string& clientId, const SubscribePayload& payload);
  void removeClient(const string& clientId,
                    const shared_ptr<ClientChannel>& channel);

  /** @brief Runs a provider callback behind an exception boundary. */
  template <typename F>
  void invokeCallback(const char* name, const string& clientId, F&& f) {
    try {
      f();
    } catch (const std::exception& ex) {
      STERROR << "Exception in " << name << " callback (client=" << clientId
              << "): " << ex.what();
    }
  }

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  PidFile pidFile;

  ConnectCallback onConnect;
  DisconnectCallback onDisconnect;
  InputCallback onInput;
  ResizeCallback onResize;
  RenderCallback onRenderNeeded;

  /** @brief Guards `clients`. */
  mutex clientMutex;
  map<string, ClientRecord> clients;

  atomic<uint64_t> sequenceNumber;
  atomic<bool> halt;

  /** @brief Serializes start/stop. */
  mutex lifecycleMutex;
  bool running;
  shared_ptr<thread> acceptThread;

  mutex connectionThreadMutex;
  list<ConnectionThread> connectionThreads;
};
}  // namespace tabby

#endif  // __TABBY_RENDER_SERVER__
