#ifndef __TB_SESSION_REGISTRY__
#define __TB_SESSION_REGISTRY__

#include "Headers.hpp"
#include "ProcessHandle.hpp"
#include "Session.hpp"

namespace tb {
/**
 * @brief How new sessions are launched and how much they keep.
 */
struct SessionSettings {
  /** @brief Shell to launch; empty means $SHELL, then /bin/bash. */
  string shell;
  int scrollbackLines = DEFAULT_SCROLLBACK_LINES;
  int64_t maxBufferBytes = DEFAULT_MAX_BUFFER_BYTES;
};

/**
 * @brief Owns every live session, keyed by process id.
 *
 * Must be held in a shared_ptr: sessions reach back through a weak pointer
 * to remove themselves once their process exited.  The registry lock is
 * never held while calling into a session.
 */
class SessionRegistry : public std::enable_shared_from_this<SessionRegistry> {
 public:
  SessionRegistry(shared_ptr<ProcessSpawner> _spawner,
                  const SessionSettings& _settings);

  /**
   * @brief Spawns a shell sized columns x rows (80x24 when not positive).
   * @throws SpawnError if the process could not be created.
   */
  int64_t create(int columns, int rows);
  /** @throws SessionGone when absent or terminating. */
  shared_ptr<Session> get(int64_t sessionId);
  void remove(int64_t sessionId);

  /** @throws SessionGone when absent or terminating. */
  void terminate(int64_t sessionId);
  /** @throws SessionGone when absent or terminating. */
  void resize(int64_t sessionId, int columns, int rows);

  size_t size();
  vector<int64_t> ids();
  void terminateAll();

  ProcessOptions buildProcessOptions(int columns, int rows) const;

 protected:
  shared_ptr<ProcessSpawner> spawner;
  SessionSettings settings;
  mutex registryMutex;
  map<int64_t, shared_ptr<Session>> sessions;
};
}  // namespace tb

#endif  // __TB_SESSION_REGISTRY__
