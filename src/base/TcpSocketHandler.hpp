#ifndef __TB_TCP_SOCKET_HANDLER__
#define __TB_TCP_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace tb {
/**
 * @brief POSIX TCP implementation of SocketHandler with a mutex per active
 * socket.
 */
class TcpSocketHandler : public SocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);

  /** @brief Resolves the endpoint and connects, returning a blocking fd. */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds every address matching the endpoint name (all interfaces when
   * empty) on the endpoint port.
   * @throws std::runtime_error if the port cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual int accept(int fd);
  virtual void stopListening(const SocketEndpoint& endpoint);
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  void addToActiveSockets(int fd);
  /** @brief Non-blocking mode and TCP_NODELAY for data sockets. */
  virtual void initSocket(int fd);
  /** @brief Adds SO_REUSEADDR for listening sockets. */
  virtual void initServerSocket(int fd);
  shared_ptr<recursive_mutex> getSocketMutex(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Listening sockets per TCP port. */
  map<int, set<int>> portServerSockets;
  /** @brief Guards both maps. */
  recursive_mutex globalMutex;
};
}  // namespace tb

#endif  // __TB_TCP_SOCKET_HANDLER__
