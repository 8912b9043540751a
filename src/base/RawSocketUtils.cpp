#include "RawSocketUtils.hpp"

namespace tb {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }

  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = errno;
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      STERROR << "Cannot write to raw socket: " << strerror(localErrno);
      throw std::runtime_error("Cannot write to raw socket");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to raw socket: socket closed");
    }
    bytesWritten += rc;
  }
}
}  // namespace tb
