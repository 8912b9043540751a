#include "CommandRunner.hpp"
#include "ControlServer.hpp"
#include "FakeProcessHandle.hpp"
#include "SessionRegistry.hpp"
#include "SignalPipe.hpp"
#include "TestHeaders.hpp"

using namespace tb;

TEST_CASE("Signals arrive as bytes on the pipe", "[SignalPipe]") {
  SignalPipe signals;
  signals.install(SIGUSR1);
  REQUIRE(::raise(SIGUSR1) == 0);
  REQUIRE(signals.wait() == SIGUSR1);

  signals.wake();
  REQUIRE(signals.wait() == 0);
}

TEST_CASE("A signal stops the control server", "[SignalPipe]") {
  auto spawner = make_shared<FakeProcessSpawner>();
  auto registry = make_shared<SessionRegistry>(spawner, SessionSettings());
  auto runner = make_shared<CommandRunner>(spawner, DEFAULT_COMMAND_TIMEOUT);
  ControlServer server(registry, runner);
  REQUIRE(server.bindToAnyPort("127.0.0.1") > 0);

  SignalPipe signals;
  signals.install(SIGUSR2);
  atomic<bool> listenReturned(false);
  thread serverThread([&server, &listenReturned]() {
    server.listenAfterBind();
    listenReturned = true;
  });
  atomic<int> received(0);
  thread shutdownThread([&server, &signals, &received]() {
    received = signals.wait();
    server.stop();
  });

  for (int i = 0; i < 500 && !server.isRunning(); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(server.isRunning());
  REQUIRE(::raise(SIGUSR2) == 0);

  shutdownThread.join();
  serverThread.join();
  REQUIRE(received == SIGUSR2);
  REQUIRE(listenReturned);
}
