#ifndef __TB_STREAM_SERVER__
#define __TB_STREAM_SERVER__

#include "Headers.hpp"
#include "SessionRegistry.hpp"
#include "SocketHandler.hpp"
#include "SocketTransport.hpp"

namespace tb {
/**
 * @brief Accepts stream connections and binds each one to a session.
 *
 * The first packet of a connection must be an ATTACH_REQUEST.  After a
 * successful attach the connection carries input and resizes to the session
 * and terminal output back, until either side goes away.  Each connection is
 * served by its own thread.
 */
class StreamServer {
 public:
  /** @throws std::runtime_error if the endpoint cannot be bound. */
  StreamServer(shared_ptr<SocketHandler> _socketHandler,
               const SocketEndpoint& _serverEndpoint,
               shared_ptr<SessionRegistry> _registry);
  ~StreamServer();

  /** @brief Accept loop, returns after shutdown(). */
  void run();
  void shutdown();
  bool isHalted();
  /** @brief Connection threads not yet joined. */
  size_t connectionThreadCount();

 protected:
  void acceptNewConnection(int serverFd);
  void handleConnection(int clientFd, shared_ptr<atomic<bool>> finished);
  shared_ptr<Session> waitForAttach(
      int clientFd, const shared_ptr<SocketTransport>& transport);
  void serveConnection(int clientFd, const shared_ptr<Session>& session);
  void reapFinishedConnections();
  void joinConnections();

  struct ConnectionThread {
    shared_ptr<thread> worker;
    shared_ptr<atomic<bool>> finished;
  };

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<SessionRegistry> registry;
  set<int> serverPortFds;

  mutex connectionMutex;
  vector<ConnectionThread> connectionThreads;
  set<shared_ptr<SocketTransport>> activeTransports;
  bool halt;
};
}  // namespace tb

#endif  // __TB_STREAM_SERVER__
