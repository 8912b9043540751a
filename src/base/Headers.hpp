#ifndef __TB_HEADERS__
#define __TB_HEADERS__

// httplib has to come before the system socket headers
#include "httplib.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <pty.h>
#include <pwd.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "TermBridge.pb.h"
#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Default listening ports for the control (HTTP) and stream (TCP) surfaces
const int DEFAULT_CONTROL_PORT = 8767;
const int DEFAULT_STREAM_PORT = 8768;

// Default geometry when a client does not send one
const int DEFAULT_COLUMNS = 80;
const int DEFAULT_ROWS = 24;

// Lines kept above the visible screen by the screen model
const int DEFAULT_SCROLLBACK_LINES = 1000;

// Raw output kept while unattached before the buffer is compacted
const int64_t DEFAULT_MAX_BUFFER_BYTES = 1024 * 1024;

// Seconds before a one-shot command is killed
const int DEFAULT_COMMAND_TIMEOUT = 30;

// Largest packet accepted on the stream socket
const int64_t MAX_PACKET_LENGTH = 128 * 1024 * 1024;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)    \
  if (((X) == -1) && errno != EINVAL) \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef TB_VERSION
#define TB_VERSION "unknown"
#endif

namespace tb {
inline std::ostream &operator<<(std::ostream &os,
                                const tb::SocketEndpoint &se) {
  if (se.has_name()) {
    os << se.name();
  }
  if (se.has_port()) {
    os << ":" << se.port();
  }
  return os;
}

template <typename T>
inline T stringToProto(const string &s) {
  T t;
  if (!t.ParseFromString(s)) {
    throw std::runtime_error("Error parsing string to proto " +
                             t.GetTypeName());
  }
  return t;
}

template <typename T>
inline string protoToString(const T &t) {
  string s;
  if (!t.SerializeToString(&s)) {
    STFATAL << "Error serializing proto to string";
  }
  return s;
}

inline string GetTempDirectory() { return string(_PATH_TMP); }

/** @brief Parses a positive decimal integer, returning `fallback` otherwise. */
inline int parsePositiveInt(const string &s, int fallback) {
  if (s.empty()) {
    return fallback;
  }
  try {
    size_t consumed = 0;
    int value = std::stoi(s, &consumed);
    if (consumed != s.length() || value <= 0) {
      return fallback;
    }
    return value;
  } catch (const std::logic_error &) {
    return fallback;
  }
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace tb

#endif  // __TB_HEADERS__
