#include "CommandRunner.hpp"

#include "AnsiStripper.hpp"

namespace tb {
namespace {
struct CommandCapture {
  mutex captureMutex;
  condition_variable exitCondition;
  string output;
  bool exited = false;
  int exitCode = -1;
};

// Time left for a killed command to flush and exit
const int KILL_GRACE_SECONDS = 5;
}  // namespace

CommandRunner::CommandRunner(shared_ptr<ProcessSpawner> _spawner,
                             int _timeoutSeconds)
    : spawner(_spawner), timeoutSeconds(_timeoutSeconds) {}

ProcessOptions CommandRunner::buildProcessOptions(
    const string& command) const {
  ProcessOptions options;
  options.file = "/bin/bash";
  options.args = {"-c", command};
  options.columns = DEFAULT_COLUMNS;
  options.rows = DEFAULT_ROWS;
  const char* homeEnv = ::getenv("HOME");
  if (homeEnv && *homeEnv) {
    options.cwd = homeEnv;
  }
  options.env["TERM"] = "xterm-256color";
  return options;
}

string CommandRunner::execute(const string& command) {
  auto capture = make_shared<CommandCapture>();
  auto process = spawner->spawn(buildProcessOptions(command));
  auto dataSubscription = process->onData([capture](const string& chunk) {
    lock_guard<mutex> guard(capture->captureMutex);
    capture->output.append(chunk);
  });
  auto exitSubscription = process->onExit([capture](int code) {
    lock_guard<mutex> guard(capture->captureMutex);
    capture->exited = true;
    capture->exitCode = code;
    capture->exitCondition.notify_all();
  });
  VLOG(1) << "Running command in process " << process->getId();
  process->start();

  string output;
  {
    unique_lock<mutex> lock(capture->captureMutex);
    if (!capture->exitCondition.wait_for(
            lock, std::chrono::seconds(timeoutSeconds),
            [capture] { return capture->exited; })) {
      LOG(WARNING) << "Command in process " << process->getId()
                   << " timed out after " << timeoutSeconds
                   << " seconds, killing it";
      lock.unlock();
      process->kill();
      lock.lock();
      capture->exitCondition.wait_for(
          lock, std::chrono::seconds(KILL_GRACE_SECONDS),
          [capture] { return capture->exited; });
    } else {
      VLOG(1) << "Command exited with code " << capture->exitCode;
    }
    output = capture->output;
  }
  dataSubscription->cancel();
  exitSubscription->cancel();
  return AnsiStripper::strip(output);
}
}  // namespace tb
