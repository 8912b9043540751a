#include "SocketTransport.hpp"

#include "BridgeErrors.hpp"

namespace tb {
SocketTransport::SocketTransport(shared_ptr<SocketHandler> _socketHandler,
                                 int _fd)
    : socketHandler(_socketHandler),
      fd(_fd),
      id(sole::uuid4().str()),
      closed(false) {}

void SocketTransport::writePacket(const Packet& packet) {
  lock_guard<mutex> guard(writeMutex);
  if (closed) {
    throw TransportWriteFailure("Transport " + id + " is closed");
  }
  try {
    socketHandler->writePacket(fd, packet);
  } catch (const std::runtime_error& re) {
    closed = true;
    ::shutdown(fd, SHUT_RDWR);
    throw TransportWriteFailure(re.what());
  }
}

void SocketTransport::send(const string& data) {
  TerminalBuffer terminalBuffer;
  terminalBuffer.set_buffer(data);
  writePacket(Packet(uint8_t(StreamPacketType::TERMINAL_BUFFER),
                     protoToString(terminalBuffer)));
}

void SocketTransport::sendAttachResponse(const string& error) {
  AttachResponse response;
  if (!error.empty()) {
    response.set_error(error);
  }
  writePacket(Packet(uint8_t(StreamPacketType::ATTACH_RESPONSE),
                     protoToString(response)));
}

void SocketTransport::sendEndOfStream(int exitCode) {
  SessionEnd sessionEnd;
  sessionEnd.set_exit_code(exitCode);
  writePacket(Packet(uint8_t(StreamPacketType::SESSION_END),
                     protoToString(sessionEnd)));
  shutdown();
}

void SocketTransport::shutdown() {
  lock_guard<mutex> guard(writeMutex);
  if (closed) {
    return;
  }
  closed = true;
  VLOG(1) << "Shutting down transport " << id;
  // The handler thread sees EOF and closes the fd.
  ::shutdown(fd, SHUT_RDWR);
}

bool SocketTransport::isShutdown() {
  lock_guard<mutex> guard(writeMutex);
  return closed;
}
}  // namespace tb
