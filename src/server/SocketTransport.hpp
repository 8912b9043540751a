#ifndef __TB_SOCKET_TRANSPORT__
#define __TB_SOCKET_TRANSPORT__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "Transport.hpp"

namespace tb {
/**
 * @brief A Transport over one accepted stream socket.  Output is framed as
 * TERMINAL_BUFFER packets.  The fd stays owned by the connection handler;
 * this class never closes it.
 */
class SocketTransport : public Transport {
 public:
  SocketTransport(shared_ptr<SocketHandler> _socketHandler, int _fd);

  virtual const string& getId() const { return id; }
  virtual void send(const string& data);
  virtual void sendEndOfStream(int exitCode);

  void sendAttachResponse(const string& error);
  /** @brief Stops all further writes and wakes up the reader. */
  void shutdown();
  bool isShutdown();

 protected:
  void writePacket(const Packet& packet);

  shared_ptr<SocketHandler> socketHandler;
  int fd;
  string id;
  mutex writeMutex;
  bool closed;
};
}  // namespace tb

#endif  // __TB_SOCKET_TRANSPORT__
