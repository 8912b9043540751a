#ifndef __TB_PROCESS_HANDLE__
#define __TB_PROCESS_HANDLE__

#include "Headers.hpp"
#include "Subscription.hpp"

namespace tb {
/**
 * @brief Everything needed to launch a backing process on a pseudo-terminal.
 */
struct ProcessOptions {
  /** @brief Program to execute, looked up on PATH when not absolute. */
  string file;
  /** @brief Arguments after argv[0]. */
  vector<string> args;
  int columns = DEFAULT_COLUMNS;
  int rows = DEFAULT_ROWS;
  /** @brief Working directory for the child, unchanged when empty. */
  string cwd;
  /** @brief Variables added to (or overriding) the inherited environment. */
  map<string, string> env;
};

/**
 * @brief A running process attached to a pseudo-terminal.
 *
 * Output and exit are delivered through explicit subscriptions. Events are
 * only delivered after start(), so a caller can subscribe first and never
 * miss the beginning of the stream. The exit event fires at most once.
 */
class ProcessHandle {
 public:
  typedef function<void(const string&)> DataCallback;
  typedef function<void(int)> ExitCallback;

  virtual ~ProcessHandle() {}

  /** @brief The OS identifier of the process, unique among live processes. */
  virtual int64_t getId() const = 0;
  /** @brief Begins delivering data and exit events. */
  virtual void start() = 0;
  /**
   * @brief Writes raw bytes to the process input.
   * @throws std::runtime_error if the terminal is gone.
   */
  virtual void write(const string& data) = 0;
  virtual void resize(int columns, int rows) = 0;
  /** @brief Asks the process to exit. Completion is signalled by onExit. */
  virtual void kill() = 0;

  shared_ptr<Subscription> onData(DataCallback callback);
  shared_ptr<Subscription> onExit(ExitCallback callback);

 protected:
  /** @brief Delivers a chunk to every active data subscription, in order. */
  void emitData(const string& data);
  /**
   * @brief Delivers the exit code once. Nothing of `this` is touched after the
   * callbacks run, because a callback may release the last owner.
   */
  void emitExit(int exitCode);

  mutex listenerMutex;
  vector<pair<shared_ptr<Subscription>, DataCallback>> dataListeners;
  vector<pair<shared_ptr<Subscription>, ExitCallback>> exitListeners;
  bool exitEmitted = false;
};

/**
 * @brief Creates backing processes. The seam lets tests substitute fakes.
 */
class ProcessSpawner {
 public:
  virtual ~ProcessSpawner() {}
  /** @throws SpawnError if the process cannot be created. */
  virtual shared_ptr<ProcessHandle> spawn(const ProcessOptions& options) = 0;
};
}  // namespace tb

#endif  // __TB_PROCESS_HANDLE__
