#include "SignalPipe.hpp"

namespace tb {
namespace {
atomic<int> signalWriteFd(-1);
}  // namespace

SignalPipe::SignalPipe() {
  FATAL_FAIL(::pipe(pipeFds));
  ::fcntl(pipeFds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(pipeFds[1], F_SETFD, FD_CLOEXEC);
}

SignalPipe::~SignalPipe() {
  for (int signum : installedSignals) {
    ::signal(signum, SIG_DFL);
  }
  int expected = pipeFds[1];
  signalWriteFd.compare_exchange_strong(expected, -1);
  ::close(pipeFds[0]);
  ::close(pipeFds[1]);
}

void SignalPipe::install(int signum) {
  int expected = -1;
  if (!signalWriteFd.compare_exchange_strong(expected, pipeFds[1]) &&
      expected != pipeFds[1]) {
    STFATAL << "Another signal pipe is already installed";
  }
  installedSignals.insert(signum);
  ::signal(signum, SignalPipe::handleSignal);
}

void SignalPipe::handleSignal(int signum) {
  int fd = signalWriteFd.load();
  if (fd < 0) {
    return;
  }
  char signalByte = char(signum);
  if (::write(fd, &signalByte, 1) == -1) {
    // Nothing can be done from inside a signal handler.
  }
}

int SignalPipe::wait() {
  char signalByte = 0;
  while (true) {
    ssize_t rc = ::read(pipeFds[0], &signalByte, 1);
    if (rc == 1) {
      return int((unsigned char)signalByte);
    }
    if (rc == -1 && errno == EINTR) {
      continue;
    }
    FATAL_FAIL(rc);
    STFATAL << "Signal pipe closed";
  }
}

void SignalPipe::wake() {
  char wakeByte = 0;
  FATAL_FAIL(::write(pipeFds[1], &wakeByte, 1));
}
}  // namespace tb
