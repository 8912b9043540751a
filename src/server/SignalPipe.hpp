#ifndef __TB_SIGNAL_PIPE__
#define __TB_SIGNAL_PIPE__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Turns signals into bytes on a pipe so a regular thread can act on
 * them.
 *
 * The handler only calls write(), which is async-signal-safe.  One instance
 * may have handlers installed at a time.
 */
class SignalPipe {
 public:
  SignalPipe();
  ~SignalPipe();

  SignalPipe(const SignalPipe&) = delete;
  SignalPipe& operator=(const SignalPipe&) = delete;

  void install(int signum);
  /** @brief Blocks until a signal or wake(). Returns the signal, or 0. */
  int wait();
  void wake();

 protected:
  static void handleSignal(int signum);

  int pipeFds[2];
  set<int> installedSignals;
};
}  // namespace tb

#endif  // __TB_SIGNAL_PIPE__
