#include "Packet.hpp"
#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
struct LoopbackPair {
  LoopbackPair() : serverFd(-1), clientFd(-1) {
    socketHandler.reset(new TcpSocketHandler());
    endpoint.set_port(20000 + rand() % 10000);
    set<int> listenFds = socketHandler->listen(endpoint);
    SocketEndpoint target;
    target.set_name("127.0.0.1");
    target.set_port(endpoint.port());
    clientFd = socketHandler->connect(target);
    REQUIRE(clientFd >= 0);
    for (int attempt = 0; attempt < 100 && serverFd < 0; attempt++) {
      for (int fd : listenFds) {
        if (serverFd < 0) {
          serverFd = socketHandler->accept(fd);
        }
      }
      if (serverFd < 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
    REQUIRE(serverFd >= 0);
  }

  ~LoopbackPair() {
    socketHandler->close(clientFd);
    socketHandler->close(serverFd);
    socketHandler->stopListening(endpoint);
  }

  shared_ptr<TcpSocketHandler> socketHandler;
  SocketEndpoint endpoint;
  int serverFd;
  int clientFd;
};
}  // namespace

TEST_CASE("Packet parses its serialized form", "[Packet]") {
  string payload("bin\0ary\xff", 8);
  Packet packet(uint8_t(StreamPacketType::TERMINAL_BUFFER), payload);
  REQUIRE(packet.length() == 9);
  REQUIRE(packet.serialize() ==
          string(1, char(StreamPacketType::TERMINAL_BUFFER)) + payload);

  Packet parsed(packet.serialize());
  REQUIRE(parsed.getHeader() == StreamPacketType::TERMINAL_BUFFER);
  REQUIRE(parsed.getPayload() == payload);
}

TEST_CASE("Malformed packets are rejected", "[Packet]") {
  REQUIRE_THROWS_AS(Packet(string()), std::runtime_error);
}

TEST_CASE("A header byte alone is an empty packet", "[Packet]") {
  Packet packet(string(1, char(StreamPacketType::SESSION_END)));
  REQUIRE(packet.getHeader() == StreamPacketType::SESSION_END);
  REQUIRE(packet.getPayload().empty());
}

TEST_CASE("Packets are framed over TCP", "[Packet]") {
  LoopbackPair loopback;

  TerminalInfo info;
  info.set_column(132);
  info.set_row(43);
  loopback.socketHandler->writePacket(
      loopback.clientFd,
      Packet(uint8_t(StreamPacketType::TERMINAL_INFO), protoToString(info)));
  // A large packet spans many reads
  TerminalBuffer terminalBuffer;
  terminalBuffer.set_buffer(string(1024 * 1024, 'z'));
  std::thread writer([&loopback, &terminalBuffer]() {
    loopback.socketHandler->writePacket(
        loopback.clientFd,
        Packet(uint8_t(StreamPacketType::TERMINAL_BUFFER),
               protoToString(terminalBuffer)));
  });

  Packet packet;
  REQUIRE(loopback.socketHandler->readPacket(loopback.serverFd, &packet));
  REQUIRE(packet.getHeader() == StreamPacketType::TERMINAL_INFO);
  auto receivedInfo = stringToProto<TerminalInfo>(packet.getPayload());
  REQUIRE(receivedInfo.column() == 132);
  REQUIRE(receivedInfo.row() == 43);

  REQUIRE(loopback.socketHandler->readPacket(loopback.serverFd, &packet));
  writer.join();
  REQUIRE(packet.getHeader() == StreamPacketType::TERMINAL_BUFFER);
  REQUIRE(stringToProto<TerminalBuffer>(packet.getPayload()).buffer() ==
          terminalBuffer.buffer());
}

TEST_CASE("Reading from a closed peer throws", "[Packet]") {
  LoopbackPair loopback;
  ::shutdown(loopback.clientFd, SHUT_RDWR);
  Packet packet;
  REQUIRE_THROWS_AS(
      loopback.socketHandler->readPacket(loopback.serverFd, &packet),
      std::runtime_error);
}
