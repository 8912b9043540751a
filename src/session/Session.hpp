#ifndef __TB_SESSION__
#define __TB_SESSION__

#include "Headers.hpp"
#include "ProcessHandle.hpp"
#include "ScreenModel.hpp"
#include "StreamMultiplexer.hpp"
#include "Transport.hpp"

namespace tb {
enum class SessionState {
  RUNNING_UNATTACHED,
  RUNNING_ATTACHED,
  TERMINATING,
  TERMINATED
};

string sessionStateName(SessionState state);

/**
 * @brief One long lived terminal: a backing process, the screen model that
 * mirrors it, and at most one attached transport.
 *
 * While nobody is attached, output is kept in a buffer made of a serialized
 * snapshot followed by raw bytes the screen model has not seen yet.  Every
 * output byte reaches the screen model exactly once.
 *
 * All public methods are safe to call from any thread.
 */
class Session : public std::enable_shared_from_this<Session> {
 public:
  typedef function<void(int64_t)> TeardownCallback;

  Session(shared_ptr<ProcessHandle> _process,
          shared_ptr<ScreenModel> _screenModel, int64_t _maxBufferBytes);
  ~Session();

  /**
   * @brief Subscribes to the process and lets it run.  `onTeardown` is
   * invoked once, after the process exited and the session is TERMINATED.
   */
  void start(TeardownCallback onTeardown);

  /** @throws SessionGone once the session is terminating. */
  void attach(const shared_ptr<Transport>& transport);
  /** @brief No-op unless `transport` is the one currently attached. */
  void detach(const shared_ptr<Transport>& transport);
  /** @throws SessionGone once the session is terminating. */
  void resize(int columns, int rows);
  /** @throws SessionGone unless a transport is attached. */
  void inbound(const string& bytes);
  /** @brief Idempotent. Teardown completes when the process exits. */
  void terminate();

  int64_t getId() const { return id; }
  SessionState getState();
  int getColumns();
  int getRows();
  /** @brief Bytes held for the next attach, snapshot prefix included. */
  size_t bufferedBytes();
  bool isAttached();
  /** @throws SessionGone once terminated. */
  string snapshot();
  optional<int> getExitCode();

 protected:
  void onProcessData(const string& chunk);
  void onProcessExit(int code);
  void detachLocked(const string& reason);
  void bufferOutput(const string& chunk);
  void commitPendingOutput();
  bool isRunning() const;

  int64_t id;
  shared_ptr<ProcessHandle> process;
  shared_ptr<ScreenModel> screenModel;
  std::unique_ptr<StreamMultiplexer> multiplexer;
  int64_t maxBufferBytes;

  // snapshot prefix [0, committedLength) + raw tail
  string outputBuffer;
  size_t committedLength;

  weak_ptr<Transport> attachedTransport;
  shared_ptr<FanOutSubscription> fanOutSubscription;
  shared_ptr<Subscription> dataSubscription;
  shared_ptr<Subscription> exitSubscription;

  SessionState state;
  optional<int> exitCode;
  int columns;
  int rows;
  TeardownCallback teardownCallback;
  recursive_mutex sessionMutex;
};
}  // namespace tb

#endif  // __TB_SESSION__
