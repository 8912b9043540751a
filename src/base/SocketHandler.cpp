#include "SocketHandler.hpp"

namespace tb {
#define SOCKET_WRITE_STALL_TIMEOUT (10)

void SocketHandler::readAll(int fd, void* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    if (!waitForData(fd, 1, 0)) {
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      // Connection is closed.  Report it the same way as a broken pipe.
      errno = EPIPE;
      bytesRead = -1;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
      throw std::runtime_error("Failed a call to readAll");
    }
    pos += bytesRead;
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (currentTime > startTime + SOCKET_WRITE_STALL_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        LOG(INFO) << "Got EAGAIN, waiting...";
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      } else {
        VLOG(1) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
}

bool SocketHandler::readPacket(int fd, Packet* packet) {
  int64_t length;
  readAll(fd, &length, sizeof(int64_t));
  if (length < 0 || length > MAX_PACKET_LENGTH) {
    throw std::runtime_error("Invalid packet size: " + std::to_string(length));
  }
  if (length == 0) {
    return false;
  }
  string s(length, '\0');
  readAll(fd, &s[0], length);
  *packet = Packet(s);
  return true;
}

void SocketHandler::writePacket(int fd, const Packet& packet) {
  string s = packet.serialize();
  int64_t length = s.length();
  if (length > MAX_PACKET_LENGTH) {
    STFATAL << "Invalid message length: " << length;
  }
  writeAllOrThrow(fd, &length, sizeof(int64_t));
  writeAllOrThrow(fd, &s[0], length);
}
}  // namespace tb
