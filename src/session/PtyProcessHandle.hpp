#ifndef __TB_PTY_PROCESS_HANDLE__
#define __TB_PTY_PROCESS_HANDLE__

#include "ProcessHandle.hpp"

namespace tb {
/**
 * @brief A child process forked onto a fresh pseudo-terminal.
 *
 * A reader thread drains the master side once start() is called and turns
 * the output into data events. When the slave side closes the child is
 * reaped and the exit event fires on the reader thread.
 */
class PtyProcessHandle : public ProcessHandle {
 public:
  /** @throws SpawnError when the pty cannot be opened or exec fails. */
  static shared_ptr<PtyProcessHandle> spawn(const ProcessOptions& options);

  virtual ~PtyProcessHandle();

  virtual int64_t getId() const { return childPid; }
  virtual void start();
  virtual void write(const string& data);
  virtual void resize(int columns, int rows);
  virtual void kill();

  bool hasExited() const { return exited; }

 protected:
  PtyProcessHandle(pid_t _childPid, int _masterFd);

  void readLoop();
  int reap();

  pid_t childPid;
  int masterFd;
  std::unique_ptr<thread> readThread;
  atomic<bool> shuttingDown;
  atomic<bool> exited;
};

class PtyProcessSpawner : public ProcessSpawner {
 public:
  virtual shared_ptr<ProcessHandle> spawn(const ProcessOptions& options) {
    return PtyProcessHandle::spawn(options);
  }
};
}  // namespace tb

#endif  // __TB_PTY_PROCESS_HANDLE__
