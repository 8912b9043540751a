#ifndef __TB_SOCKET_HANDLER__
#define __TB_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace tb {
/**
 * @brief Abstract API for socket reads/writes and listener lifecycle, plus the
 * length-prefixed packet framing used by the stream surface.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /** @brief Waits up to the given time for the fd to become readable. */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /** @brief Returns true when data is ready right now. */
  virtual bool hasData(int fd) = 0;
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes.
   * @throws std::runtime_error when the peer closes or the read fails.
   */
  void readAll(int fd, void* buf, size_t count);
  /**
   * @brief Writes all bytes.
   * @throws std::runtime_error if the write fails or stalls for too long.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count);

  /**
   * @brief Reads one length-prefixed packet.
   * @returns false when the peer sent an empty frame.
   */
  bool readPacket(int fd, Packet* packet);
  /** @brief Writes one packet with its length prefix. */
  void writePacket(int fd, const Packet& packet);

  /** @brief Opens a connection, returning -1 on failure. */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Starts listening on the endpoint and returns the listen fds. */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /** @brief Accepts a pending connection, returning -1 if none is ready. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace tb

#endif  // __TB_SOCKET_HANDLER__
