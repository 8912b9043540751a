#ifndef __TB_BRIDGE_ERRORS__
#define __TB_BRIDGE_ERRORS__

#include "Headers.hpp"

namespace tb {
/**
 * @brief The backing process could not be started (missing shell, permission,
 * resource exhaustion). No session is registered when this is thrown.
 */
class SpawnError : public std::runtime_error {
 public:
  explicit SpawnError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The targeted session does not exist or has begun terminating.
 *
 * Callers should treat this as "reconnect or create a new session".
 */
class SessionGone : public std::runtime_error {
 public:
  explicit SessionGone(int64_t _sessionId)
      : std::runtime_error("Session " + std::to_string(_sessionId) +
                           " is gone"),
        sessionId(_sessionId) {}

  int64_t getSessionId() const { return sessionId; }

 protected:
  int64_t sessionId;
};

/**
 * @brief Delivery to a transport that is no longer open. Recovered locally by
 * the owning session as an implicit detach.
 */
class TransportWriteFailure : public std::runtime_error {
 public:
  explicit TransportWriteFailure(const string& what)
      : std::runtime_error(what) {}
};
}  // namespace tb

#endif  // __TB_BRIDGE_ERRORS__
