#include "PtyProcessHandle.hpp"

#include "BridgeErrors.hpp"
#include "RawSocketUtils.hpp"

extern char** environ;

namespace tb {
namespace {
vector<char*> toArgv(vector<string>& strings) {
  vector<char*> argv;
  for (auto& s : strings) {
    argv.push_back(&s[0]);
  }
  argv.push_back(NULL);
  return argv;
}

vector<string> buildEnvironment(const map<string, string>& overrides) {
  vector<string> environment;
  for (char** it = environ; it && *it; it++) {
    string entry(*it);
    auto eq = entry.find('=');
    if (eq != string::npos && overrides.count(entry.substr(0, eq))) {
      continue;
    }
    environment.push_back(entry);
  }
  for (const auto& it : overrides) {
    environment.push_back(it.first + "=" + it.second);
  }
  return environment;
}
}  // namespace

shared_ptr<PtyProcessHandle> PtyProcessHandle::spawn(
    const ProcessOptions& options) {
  if (options.file.empty()) {
    throw SpawnError("No program to run");
  }

  // Everything the child needs is prepared before forking.
  vector<string> argStrings;
  argStrings.push_back(options.file);
  argStrings.insert(argStrings.end(), options.args.begin(),
                    options.args.end());
  vector<char*> argv = toArgv(argStrings);
  vector<string> envStrings = buildEnvironment(options.env);
  vector<char*> envp = toArgv(envStrings);

  winsize ws;
  memset(&ws, 0, sizeof(winsize));
  ws.ws_col = options.columns;
  ws.ws_row = options.rows;

  // The child reports a failed exec through this pipe.  A successful exec
  // closes it and the parent reads EOF.
  int errorPipe[2];
  if (::pipe(errorPipe) == -1) {
    throw SpawnError(string("Could not create pipe: ") + strerror(errno));
  }
  ::fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC);
  long maxFd = ::sysconf(_SC_OPEN_MAX);
  if (maxFd < 0) {
    maxFd = 1024;
  }

  int masterFd;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &ws);
  switch (pid) {
    case -1: {
      int forkErrno = errno;
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      throw SpawnError(string("forkpty failed: ") + strerror(forkErrno));
    }
    case 0: {
      // child
      // Nothing but stdio and the error pipe is inherited, in particular
      // not the pty masters of other sessions.
      for (int fd = STDERR_FILENO + 1; fd < maxFd; fd++) {
        if (fd != errorPipe[1]) {
          ::close(fd);
        }
      }
      if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) == -1) {
        // Fall back to the inherited directory like a login shell would.
      }
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      signal(SIGINT, SIG_DFL);
      signal(SIGTERM, SIG_DFL);
      signal(SIGHUP, SIG_DFL);
      execvpe(argv[0], &argv[0], &envp[0]);
      int execErrno = errno;
      if (::write(errorPipe[1], &execErrno, sizeof(int)) == -1) {
        // Nothing left to report to.
      }
      _exit(127);
    }
    default:
      break;
  }

  // parent
  ::close(errorPipe[1]);
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &childErrno, sizeof(int));
  } while (rc == -1 && errno == EINTR);
  ::close(errorPipe[0]);
  if (rc > 0) {
    ::close(masterFd);
    ::waitpid(pid, NULL, 0);
    throw SpawnError("Could not execute " + options.file + ": " +
                     strerror(childErrno));
  }

  VLOG(1) << "pty opened " << masterFd << " for pid " << pid;
  return shared_ptr<PtyProcessHandle>(new PtyProcessHandle(pid, masterFd));
}

PtyProcessHandle::PtyProcessHandle(pid_t _childPid, int _masterFd)
    : childPid(_childPid),
      masterFd(_masterFd),
      shuttingDown(false),
      exited(false) {}

PtyProcessHandle::~PtyProcessHandle() {
  shuttingDown = true;
  if (readThread) {
    if (readThread->get_id() == std::this_thread::get_id()) {
      // The last owner went away inside an exit callback.  readLoop has
      // already reaped the child and touches nothing after returning.
      readThread->detach();
    } else {
      readThread->join();
    }
    readThread.reset();
  }
  if (!exited) {
    ::kill(childPid, SIGKILL);
    reap();
  }
  ::close(masterFd);
}

void PtyProcessHandle::start() {
  if (readThread) {
    LOG(WARNING) << "Process " << childPid << " was already started";
    return;
  }
  readThread.reset(new thread(&PtyProcessHandle::readLoop, this));
}

#define BUF_SIZE (16 * 1024)

void PtyProcessHandle::readLoop() {
  el::Helpers::setThreadName(string("pty-") + to_string(childPid));
  char b[BUF_SIZE];
  while (!shuttingDown) {
    fd_set rfd;
    timeval tv;
    FD_ZERO(&rfd);
    FD_SET(masterFd, &rfd);
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int rc = select(masterFd + 1, &rfd, NULL, NULL, &tv);
    if (rc == -1) {
      if (errno == EINTR) {
        continue;
      }
      STERROR << "select on pty failed: " << strerror(errno);
      break;
    }
    if (rc == 0 || !FD_ISSET(masterFd, &rfd)) {
      continue;
    }
    ssize_t bytesRead = ::read(masterFd, b, BUF_SIZE);
    if (bytesRead > 0) {
      emitData(string(b, bytesRead));
      continue;
    }
    if (bytesRead == -1 && (errno == EAGAIN || errno == EINTR)) {
      continue;
    }
    // EOF, or EIO once the slave side has been closed by the child.
    VLOG(1) << "pty for pid " << childPid << " closed";
    break;
  }
  if (shuttingDown) {
    return;
  }
  int exitCode = reap();
  emitExit(exitCode);
}

int PtyProcessHandle::reap() {
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(childPid, &status, 0);
  } while (rc == -1 && errno == EINTR);
  exited = true;
  if (rc == -1) {
    LOG(WARNING) << "waitpid failed for " << childPid << ": "
                 << strerror(errno);
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

void PtyProcessHandle::write(const string& data) {
  if (exited) {
    throw std::runtime_error("Process " + to_string(childPid) +
                             " has already exited");
  }
  RawSocketUtils::writeAll(masterFd, data.c_str(), data.length());
}

void PtyProcessHandle::resize(int columns, int rows) {
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(winsize));
  tmpwin.ws_row = rows;
  tmpwin.ws_col = columns;
  if (::ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    LOG(WARNING) << "Could not resize pty " << masterFd << ": "
                 << strerror(errno);
  }
}

void PtyProcessHandle::kill() {
  if (exited) {
    return;
  }
  VLOG(1) << "Sending SIGHUP to " << childPid;
  ::kill(childPid, SIGHUP);
}
}  // namespace tb
