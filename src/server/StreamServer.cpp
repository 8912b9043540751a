#include "StreamServer.hpp"

#include "BridgeErrors.hpp"

namespace tb {
StreamServer::StreamServer(shared_ptr<SocketHandler> _socketHandler,
                           const SocketEndpoint& _serverEndpoint,
                           shared_ptr<SessionRegistry> _registry)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      registry(_registry),
      halt(false) {
  serverPortFds = socketHandler->listen(serverEndpoint);
}

StreamServer::~StreamServer() {
  shutdown();
  joinConnections();
  socketHandler->stopListening(serverEndpoint);
}

bool StreamServer::isHalted() {
  lock_guard<mutex> guard(connectionMutex);
  return halt;
}

void StreamServer::shutdown() {
  lock_guard<mutex> guard(connectionMutex);
  if (!halt) {
    LOG(INFO) << "Shutting down stream server";
  }
  halt = true;
  for (auto& transport : activeTransports) {
    transport->shutdown();
  }
}

void StreamServer::run() {
  LOG(INFO) << "Stream server listening on " << serverEndpoint;
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  for (int i : serverPortFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (!isHalted()) {
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1 && errno == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }
    for (int i : serverPortFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
  }
  joinConnections();
}

size_t StreamServer::connectionThreadCount() {
  lock_guard<mutex> guard(connectionMutex);
  return connectionThreads.size();
}

void StreamServer::reapFinishedConnections() {
  vector<ConnectionThread> finishedThreads;
  {
    lock_guard<mutex> guard(connectionMutex);
    auto running = std::partition(
        connectionThreads.begin(), connectionThreads.end(),
        [](const ConnectionThread& ct) { return !ct.finished->load(); });
    finishedThreads.assign(running, connectionThreads.end());
    connectionThreads.erase(running, connectionThreads.end());
  }
  for (auto& it : finishedThreads) {
    it.worker->join();
  }
}

void StreamServer::joinConnections() {
  vector<ConnectionThread> threads;
  {
    lock_guard<mutex> guard(connectionMutex);
    threads.swap(connectionThreads);
  }
  for (auto& it : threads) {
    it.worker->join();
  }
}

void StreamServer::acceptNewConnection(int serverFd) {
  reapFinishedConnections();
  int clientFd = socketHandler->accept(serverFd);
  if (clientFd < 0) {
    return;
  }
  VLOG(1) << "New stream connection on fd " << clientFd;
  ConnectionThread connectionThread;
  connectionThread.finished.reset(new atomic<bool>(false));
  lock_guard<mutex> guard(connectionMutex);
  connectionThread.worker.reset(new thread(&StreamServer::handleConnection,
                                           this, clientFd,
                                           connectionThread.finished));
  connectionThreads.push_back(connectionThread);
}

shared_ptr<Session> StreamServer::waitForAttach(
    int clientFd, const shared_ptr<SocketTransport>& transport) {
  Packet packet;
  while (true) {
    if (isHalted() || transport->isShutdown()) {
      throw std::runtime_error("Connection closed before attaching");
    }
    if (!socketHandler->waitForData(clientFd, 0, 100000)) {
      continue;
    }
    if (socketHandler->readPacket(clientFd, &packet)) {
      break;
    }
  }
  if (packet.getHeader() != uint8_t(StreamPacketType::ATTACH_REQUEST)) {
    throw std::runtime_error("Expected an attach request but got packet " +
                             to_string(int(packet.getHeader())));
  }
  auto request = stringToProto<AttachRequest>(packet.getPayload());
  return registry->get(request.session_id());
}

void StreamServer::serveConnection(int clientFd,
                                   const shared_ptr<Session>& session) {
  while (!isHalted()) {
    if (!socketHandler->waitForData(clientFd, 0, 100000)) {
      continue;
    }
    Packet packet;
    if (!socketHandler->readPacket(clientFd, &packet)) {
      continue;
    }
    switch (packet.getHeader()) {
      case StreamPacketType::TERMINAL_BUFFER: {
        auto terminalBuffer =
            stringToProto<TerminalBuffer>(packet.getPayload());
        VLOG(4) << "Got " << terminalBuffer.buffer().length()
                << " bytes of input for terminal " << session->getId();
        session->inbound(terminalBuffer.buffer());
        break;
      }
      case StreamPacketType::TERMINAL_INFO: {
        auto info = stringToProto<TerminalInfo>(packet.getPayload());
        if (info.column() <= 0 || info.row() <= 0) {
          LOG(WARNING) << "Ignoring invalid terminal size " << info.column()
                       << "x" << info.row();
          break;
        }
        session->resize(info.column(), info.row());
        break;
      }
      default:
        LOG(WARNING) << "Ignoring unexpected packet "
                     << int(packet.getHeader());
        break;
    }
  }
}

void StreamServer::handleConnection(int clientFd,
                                    shared_ptr<atomic<bool>> finished) {
  el::Helpers::setThreadName(string("stream-") + to_string(clientFd));
  auto transport = make_shared<SocketTransport>(socketHandler, clientFd);
  {
    lock_guard<mutex> guard(connectionMutex);
    activeTransports.insert(transport);
  }

  shared_ptr<Session> session;
  bool responded = false;
  try {
    session = waitForAttach(clientFd, transport);
    transport->sendAttachResponse("");
    responded = true;
    session->attach(transport);
    LOG(INFO) << "Connection " << transport->getId() << " attached to terminal "
              << session->getId();
    serveConnection(clientFd, session);
  } catch (const SessionGone& sg) {
    LOG(INFO) << "Connection " << transport->getId() << ": " << sg.what();
    try {
      if (!responded) {
        transport->sendAttachResponse(sg.what());
      } else {
        optional<int> exitCode;
        if (session) {
          exitCode = session->getExitCode();
        }
        transport->sendEndOfStream(exitCode ? *exitCode : -1);
      }
    } catch (const TransportWriteFailure& twf) {
      VLOG(1) << "Could not report to " << transport->getId() << ": "
              << twf.what();
    }
  } catch (const TransportWriteFailure& twf) {
    LOG(INFO) << "Connection " << transport->getId()
              << " failed: " << twf.what();
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Connection " << transport->getId()
              << " ended: " << re.what();
  }

  if (session) {
    session->detach(transport);
  }
  transport->shutdown();
  {
    lock_guard<mutex> guard(connectionMutex);
    activeTransports.erase(transport);
  }
  socketHandler->close(clientFd);
  *finished = true;
}
}  // namespace tb
