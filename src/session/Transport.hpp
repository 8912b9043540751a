#ifndef __TB_TRANSPORT__
#define __TB_TRANSPORT__

#include "Headers.hpp"

namespace tb {
/**
 * @brief One client connection that can carry terminal output.
 *
 * The session layer only pushes bytes; reading client input is done by the
 * owner of the connection, which forwards it to Session::inbound.
 */
class Transport {
 public:
  virtual ~Transport() {}

  /** @brief Stable identifier for logging. */
  virtual const string& getId() const = 0;

  /**
   * @brief Sends one chunk of terminal output.
   * @throws TransportWriteFailure if the peer can no longer be written to.
   */
  virtual void send(const string& data) = 0;

  /**
   * @brief Tells the peer the process exited and closes the outbound side.
   * @throws TransportWriteFailure if the peer is already gone.
   */
  virtual void sendEndOfStream(int exitCode) = 0;
};
}  // namespace tb

#endif  // __TB_TRANSPORT__
