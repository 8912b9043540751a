#ifndef __TB_COMMAND_RUNNER__
#define __TB_COMMAND_RUNNER__

#include "Headers.hpp"
#include "ProcessHandle.hpp"

namespace tb {
/**
 * @brief Runs a single shell command on its own pty and returns what it
 * printed, with terminal control sequences removed.
 */
class CommandRunner {
 public:
  CommandRunner(shared_ptr<ProcessSpawner> _spawner, int _timeoutSeconds);

  /**
   * @brief Blocks until the command exits or the timeout kills it.
   * @throws SpawnError if bash could not be started.
   */
  string execute(const string& command);

  ProcessOptions buildProcessOptions(const string& command) const;

 protected:
  shared_ptr<ProcessSpawner> spawner;
  int timeoutSeconds;
};
}  // namespace tb

#endif  // __TB_COMMAND_RUNNER__
