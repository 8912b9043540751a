#include "SessionRegistry.hpp"

#include "BridgeErrors.hpp"
#include "VtScreenModel.hpp"

namespace tb {
SessionRegistry::SessionRegistry(shared_ptr<ProcessSpawner> _spawner,
                                 const SessionSettings& _settings)
    : spawner(_spawner), settings(_settings) {}

ProcessOptions SessionRegistry::buildProcessOptions(int columns,
                                                    int rows) const {
  ProcessOptions options;
  options.file = settings.shell;
  if (options.file.empty()) {
    const char* shellEnv = ::getenv("SHELL");
    options.file = (shellEnv && *shellEnv) ? shellEnv : "/bin/bash";
  }
  options.args.push_back("-l");
  options.columns = columns > 0 ? columns : DEFAULT_COLUMNS;
  options.rows = rows > 0 ? rows : DEFAULT_ROWS;
  const char* homeEnv = ::getenv("HOME");
  if (homeEnv && *homeEnv) {
    options.cwd = homeEnv;
  } else {
    passwd* pwd = getpwuid(getuid());
    if (pwd != NULL) {
      options.cwd = pwd->pw_dir;
    }
  }
  options.env["TERM"] = "xterm-256color";
  options.env["COLORTERM"] = "truecolor";
  return options;
}

int64_t SessionRegistry::create(int columns, int rows) {
  ProcessOptions options = buildProcessOptions(columns, rows);
  auto process = spawner->spawn(options);
  auto screenModel = make_shared<VtScreenModel>(
      options.columns, options.rows, settings.scrollbackLines);
  auto session =
      make_shared<Session>(process, screenModel, settings.maxBufferBytes);
  int64_t sessionId = session->getId();
  {
    lock_guard<mutex> guard(registryMutex);
    if (sessions.find(sessionId) != sessions.end()) {
      process->kill();
      throw SpawnError("Terminal id " + to_string(sessionId) +
                       " is already in use");
    }
    sessions[sessionId] = session;
  }

  weak_ptr<SessionRegistry> weakRegistry = shared_from_this();
  session->start([weakRegistry](int64_t exitedId) {
    auto registry = weakRegistry.lock();
    if (registry) {
      registry->remove(exitedId);
    }
  });
  LOG(INFO) << "Created terminal " << sessionId << " running "
            << options.file;
  return sessionId;
}

shared_ptr<Session> SessionRegistry::get(int64_t sessionId) {
  shared_ptr<Session> session;
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
      throw SessionGone(sessionId);
    }
    session = it->second;
  }
  SessionState state = session->getState();
  if (state == SessionState::TERMINATING ||
      state == SessionState::TERMINATED) {
    throw SessionGone(sessionId);
  }
  return session;
}

void SessionRegistry::remove(int64_t sessionId) {
  shared_ptr<Session> session;
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
      return;
    }
    // The session is released outside of the lock
    session = it->second;
    sessions.erase(it);
  }
  LOG(INFO) << "Removed terminal " << sessionId;
}

void SessionRegistry::terminate(int64_t sessionId) {
  get(sessionId)->terminate();
}

void SessionRegistry::resize(int64_t sessionId, int columns, int rows) {
  get(sessionId)->resize(columns, rows);
}

size_t SessionRegistry::size() {
  lock_guard<mutex> guard(registryMutex);
  return sessions.size();
}

vector<int64_t> SessionRegistry::ids() {
  lock_guard<mutex> guard(registryMutex);
  vector<int64_t> retval;
  for (const auto& it : sessions) {
    retval.push_back(it.first);
  }
  return retval;
}

void SessionRegistry::terminateAll() {
  vector<shared_ptr<Session>> allSessions;
  {
    lock_guard<mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      allSessions.push_back(it.second);
    }
  }
  LOG(INFO) << "Terminating " << allSessions.size() << " terminals";
  for (auto& session : allSessions) {
    session->terminate();
  }
}
}  // namespace tb
