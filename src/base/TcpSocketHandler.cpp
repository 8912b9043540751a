#include "TcpSocketHandler.hpp"

namespace tb {
TcpSocketHandler::TcpSocketHandler() {}

bool TcpSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n <= 0) {
    // Timed out or interrupted
    return false;
  }
  VLOG(4) << "socket " << fd << " has data";
  return FD_ISSET(fd, &input);
}

bool TcpSocketHandler::hasData(int fd) { return waitForData(fd, 0, 0); }

shared_ptr<recursive_mutex> TcpSocketHandler::getSocketMutex(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t TcpSocketHandler::read(int fd, void *buf, size_t count) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to read from a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t TcpSocketHandler::write(int fd, const void *buf, size_t count) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to write to a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  return ::send(fd, buf, count, MSG_NOSIGNAL);
}

void TcpSocketHandler::addToActiveSockets(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  addrinfo hints;
  addrinfo *results = NULL;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_ADDRCONFIG;
  string portname = std::to_string(endpoint.port());
  int rc =
      getaddrinfo(endpoint.name().c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": "
               << gai_strerror(rc);
    return -1;
  }

  int sockFd = -1;
  for (addrinfo *p = results; p != NULL; p = p->ai_next) {
    sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    break;
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << endpoint;
    return -1;
  }
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  VLOG(1) << "Connected to " << endpoint << " using fd " << sockFd;
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) != portServerSockets.end()) {
    STFATAL << "Tried to listen twice on the same port";
  }

  addrinfo hints, *servinfo;
  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  string portname = std::to_string(port);
  const char *node = NULL;
  if (endpoint.has_name() && !endpoint.name().empty()) {
    node = endpoint.name().c_str();
  }
  int rc = getaddrinfo(node, portname.c_str(), &hints, &servinfo);
  if (rc != 0) {
    throw std::runtime_error(string("Error getting address info: ") +
                             gai_strerror(rc));
  }

  set<int> serverSockets;
  for (addrinfo *p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      // IPV4 gets its own socket from the next addrinfo entry
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      // This most often happens because the port is in use.
      stringstream oss;
      oss << "Error binding port " << port << ": " << errno << " "
          << strerror(errno);
      LOG(ERROR) << oss.str();
      ::close(sockFd);
      for (int fd : serverSockets) {
        ::close(fd);
      }
      freeaddrinfo(servinfo);
      throw std::runtime_error(oss.str());
    }

    FATAL_FAIL(::listen(sockFd, 32));
    LOG(INFO) << "Listening on " << endpoint << "/" << p->ai_family;
    serverSockets.insert(sockFd);
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    throw std::runtime_error("Could not bind to any interface for port " +
                             portname);
  }

  portServerSockets[port] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = portServerSockets.find(endpoint.port());
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a port without calling listen() "
               "first";
  }
  return it->second;
}

int TcpSocketHandler::accept(int sockFd) {
  sockaddr_storage client;
  socklen_t c = sizeof(client);
  int clientSock = ::accept(sockFd, (sockaddr *)&client, &c);
  auto acceptErrno = errno;
  if (clientSock >= 0) {
    addToActiveSockets(clientSock);
    initSocket(clientSock);
    VLOG(3) << "Socket " << sockFd << " accepted client " << clientSock;
    return clientSock;
  }
  if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK &&
      acceptErrno != ECONNABORTED && acceptErrno != EINTR) {
    FATAL_FAIL(-1);  // STFATAL with the error
  }
  errno = acceptErrno;
  return -1;
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = portServerSockets.find(endpoint.port());
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to stop listening to a port that we weren't listening on";
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  portServerSockets.erase(it);
}

void TcpSocketHandler::close(int fd) {
  lock_guard<recursive_mutex> globalGuard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    // Connection was already closed.
    VLOG(1) << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

vector<int> TcpSocketHandler::getActiveSockets() {
  lock_guard<recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (auto &it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void TcpSocketHandler::initSocket(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}

void TcpSocketHandler::initServerSocket(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
  int flag = 1;
  FATAL_FAIL(
      setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (char *)&flag, sizeof(int)));
}
}  // namespace tb
