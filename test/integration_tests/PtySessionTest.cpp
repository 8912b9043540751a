#include "BridgeErrors.hpp"
#include "FakeTransport.hpp"
#include "PtyProcessHandle.hpp"
#include "SessionRegistry.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
template <typename F>
bool waitUntil(F condition, int timeoutMs = 10000) {
  for (int waited = 0; waited < timeoutMs; waited += 10) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

struct OutputCollector {
  mutex collectorMutex;
  string output;
  optional<int> exitCode;

  string getOutput() {
    lock_guard<mutex> guard(collectorMutex);
    return output;
  }
  optional<int> getExitCode() {
    lock_guard<mutex> guard(collectorMutex);
    return exitCode;
  }
};

ProcessOptions shellCommand(const string& command) {
  ProcessOptions options;
  options.file = "/bin/sh";
  options.args = {"-c", command};
  options.env["TERM"] = "xterm-256color";
  return options;
}

shared_ptr<SessionRegistry> bashRegistry() {
  SessionSettings settings;
  settings.shell = "/bin/bash";
  return make_shared<SessionRegistry>(make_shared<PtyProcessSpawner>(),
                                      settings);
}
}  // namespace

TEST_CASE("Pty process reports output and exit code", "[PtyProcessHandle]") {
  auto collector = make_shared<OutputCollector>();
  auto process = PtyProcessHandle::spawn(shellCommand("printf abc; exit 7"));
  auto dataSubscription = process->onData([collector](const string& chunk) {
    lock_guard<mutex> guard(collector->collectorMutex);
    collector->output += chunk;
  });
  auto exitSubscription = process->onExit([collector](int code) {
    lock_guard<mutex> guard(collector->collectorMutex);
    collector->exitCode = code;
  });
  process->start();

  REQUIRE(waitUntil([&]() { return bool(collector->getExitCode()); }));
  REQUIRE(*collector->getExitCode() == 7);
  REQUIRE(collector->getOutput() == "abc");
  REQUIRE(process->hasExited());
  REQUIRE_THROWS_AS(process->write("too late"), std::runtime_error);
}

TEST_CASE("Signals map to 128 plus the signal", "[PtyProcessHandle]") {
  auto collector = make_shared<OutputCollector>();
  auto process = PtyProcessHandle::spawn(shellCommand("sleep 30"));
  auto exitSubscription = process->onExit([collector](int code) {
    lock_guard<mutex> guard(collector->collectorMutex);
    collector->exitCode = code;
  });
  process->start();
  process->kill();
  REQUIRE(waitUntil([&]() { return bool(collector->getExitCode()); }));
  REQUIRE(*collector->getExitCode() == 128 + SIGHUP);
}

TEST_CASE("Children do not inherit other pty masters", "[PtyProcessHandle]") {
  auto sleeper = PtyProcessHandle::spawn(shellCommand("sleep 30"));
  sleeper->start();

  auto collector = make_shared<OutputCollector>();
  auto process = PtyProcessHandle::spawn(
      shellCommand("ls -l /proc/$$/fd | grep -c ptmx"));
  auto dataSubscription = process->onData([collector](const string& chunk) {
    lock_guard<mutex> guard(collector->collectorMutex);
    collector->output += chunk;
  });
  auto exitSubscription = process->onExit([collector](int code) {
    lock_guard<mutex> guard(collector->collectorMutex);
    collector->exitCode = code;
  });
  process->start();

  REQUIRE(waitUntil([&]() { return bool(collector->getExitCode()); }));
  REQUIRE(collector->getOutput() == "0\r\n");
  sleeper->kill();
}

TEST_CASE("Missing programs fail to spawn", "[PtyProcessHandle]") {
  ProcessOptions options;
  options.file = "/nonexistent/tb-no-such-shell";
  REQUIRE_THROWS_AS(PtyProcessHandle::spawn(options), SpawnError);
}

TEST_CASE("Shell session round trip", "[PtySession]") {
  auto registry = bashRegistry();
  int64_t id = registry->create(80, 24);
  auto session = registry->get(id);
  auto transport = make_shared<FakeTransport>("client");
  session->attach(transport);
  REQUIRE(session->isAttached());

  session->inbound("echo $((6*7))\n");
  REQUIRE(waitUntil([&]() {
    return transport->getLiveData().find("42") != string::npos;
  }));

  SECTION("Resize reaches the pty") {
    registry->resize(id, 40, 10);
    session->inbound("stty size\n");
    REQUIRE(waitUntil([&]() {
      return transport->getLiveData().find("10 40") != string::npos;
    }));
    REQUIRE(session->getColumns() == 40);
    REQUIRE(session->getRows() == 10);
  }

  SECTION("Output while detached shows up in the next snapshot") {
    session->inbound("sleep 1; echo marker-$((40+2))\n");
    session->detach(transport);
    REQUIRE(!session->isAttached());
    REQUIRE(waitUntil([&]() { return session->bufferedBytes() > 0; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));

    auto second = make_shared<FakeTransport>("second");
    session->attach(second);
    REQUIRE(second->getMessages().size() >= 1);
    REQUIRE(second->getMessages()[0].find("marker-42") != string::npos);
  }

  SECTION("Exit ends the stream and removes the session") {
    session->inbound("exit 3\n");
    REQUIRE(waitUntil([&]() { return bool(transport->getEndOfStream()); }));
    REQUIRE(*transport->getEndOfStream() == 3);
    REQUIRE(waitUntil([&]() { return registry->size() == 0; }));
    REQUIRE_THROWS_AS(registry->get(id), SessionGone);
  }
}

TEST_CASE("Terminating an unattached shell", "[PtySession]") {
  auto registry = bashRegistry();
  int64_t id = registry->create(80, 24);
  auto session = registry->get(id);

  registry->terminate(id);
  REQUIRE_THROWS_AS(registry->get(id), SessionGone);
  REQUIRE_THROWS_AS(registry->terminate(id), SessionGone);
  REQUIRE(waitUntil([&]() { return registry->size() == 0; }));
  REQUIRE(session->getState() == SessionState::TERMINATED);
  REQUIRE(session->getExitCode());
}
