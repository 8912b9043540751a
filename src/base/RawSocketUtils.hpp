#ifndef __TB_RAW_SOCKET_UTILS__
#define __TB_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Blocking write loop for raw descriptors such as a PTY master.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer, retrying on EAGAIN and EINTR.
   * @throws std::runtime_error if the descriptor is invalid or closed.
   */
  static void writeAll(int fd, const char* buf, size_t count);
};
}  // namespace tb
#endif  // __TB_RAW_SOCKET_UTILS__
