#include "Session.hpp"

#include "BridgeErrors.hpp"

namespace tb {
string sessionStateName(SessionState state) {
  switch (state) {
    case SessionState::RUNNING_UNATTACHED:
      return "RUNNING_UNATTACHED";
    case SessionState::RUNNING_ATTACHED:
      return "RUNNING_ATTACHED";
    case SessionState::TERMINATING:
      return "TERMINATING";
    case SessionState::TERMINATED:
      return "TERMINATED";
  }
  return "UNKNOWN";
}

Session::Session(shared_ptr<ProcessHandle> _process,
                 shared_ptr<ScreenModel> _screenModel,
                 int64_t _maxBufferBytes)
    : id(_process->getId()),
      process(_process),
      screenModel(_screenModel),
      multiplexer(new StreamMultiplexer(_process, _screenModel)),
      maxBufferBytes(_maxBufferBytes),
      committedLength(0),
      state(SessionState::RUNNING_UNATTACHED),
      columns(_screenModel->getColumns()),
      rows(_screenModel->getRows()) {}

Session::~Session() {
  if (dataSubscription) {
    dataSubscription->cancel();
  }
  if (exitSubscription) {
    exitSubscription->cancel();
  }
}

void Session::start(TeardownCallback onTeardown) {
  weak_ptr<Session> weakSelf = shared_from_this();
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    teardownCallback = onTeardown;
    dataSubscription = process->onData([weakSelf](const string& chunk) {
      auto self = weakSelf.lock();
      if (self) {
        self->onProcessData(chunk);
      }
    });
    exitSubscription = process->onExit([weakSelf](int code) {
      auto self = weakSelf.lock();
      if (self) {
        self->onProcessExit(code);
      }
    });
  }
  LOG(INFO) << "Started terminal " << id << " (" << columns << "x" << rows
            << ")";
  process->start();
}

bool Session::isRunning() const {
  return state == SessionState::RUNNING_UNATTACHED ||
         state == SessionState::RUNNING_ATTACHED;
}

void Session::attach(const shared_ptr<Transport>& transport) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (!isRunning()) {
    throw SessionGone(id);
  }
  if (fanOutSubscription) {
    LOG(INFO) << "Terminal " << id << ": "
              << fanOutSubscription->getTransportId() << " superseded by "
              << transport->getId();
    fanOutSubscription->cancel();
    fanOutSubscription.reset();
  }
  attachedTransport.reset();

  commitPendingOutput();
  outputBuffer.clear();
  committedLength = 0;

  string screenSnapshot = screenModel->serialize();
  try {
    transport->send(screenSnapshot);
  } catch (const TransportWriteFailure& twf) {
    LOG(INFO) << "Could not send snapshot of terminal " << id << " to "
              << transport->getId() << ": " << twf.what();
    outputBuffer = screenSnapshot;
    committedLength = outputBuffer.length();
    state = SessionState::RUNNING_UNATTACHED;
    return;
  }

  fanOutSubscription = multiplexer->subscribe(transport);
  attachedTransport = transport;
  state = SessionState::RUNNING_ATTACHED;
  LOG(INFO) << "Terminal " << id << " attached to " << transport->getId()
            << " (" << screenSnapshot.length() << " byte snapshot)";
}

void Session::detach(const shared_ptr<Transport>& transport) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (state != SessionState::RUNNING_ATTACHED || !fanOutSubscription ||
      fanOutSubscription->getTransport() != transport) {
    VLOG(1) << "Ignoring stale detach of " << transport->getId()
            << " from terminal " << id;
    return;
  }
  detachLocked("transport " + transport->getId() + " closed");
}

void Session::detachLocked(const string& reason) {
  if (fanOutSubscription) {
    fanOutSubscription->cancel();
    fanOutSubscription.reset();
  }
  attachedTransport.reset();
  outputBuffer = screenModel->serialize();
  committedLength = outputBuffer.length();
  state = SessionState::RUNNING_UNATTACHED;
  LOG(INFO) << "Terminal " << id << " detached (" << reason
            << "), running in the background";
}

void Session::resize(int newColumns, int newRows) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (!isRunning()) {
    throw SessionGone(id);
  }
  VLOG(1) << "Resizing terminal " << id << " to " << newColumns << "x"
          << newRows;
  process->resize(newColumns, newRows);
  // Bytes produced at the old size are interpreted at the old size.
  commitPendingOutput();
  screenModel->resize(newColumns, newRows);
  columns = newColumns;
  rows = newRows;
}

void Session::inbound(const string& bytes) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (state != SessionState::RUNNING_ATTACHED) {
    throw SessionGone(id);
  }
  try {
    multiplexer->fanIn(bytes);
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Could not write to terminal " << id << ": " << re.what();
    throw SessionGone(id);
  }
}

void Session::terminate() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (!isRunning()) {
    VLOG(1) << "Terminal " << id << " is already "
            << sessionStateName(state);
    return;
  }
  commitPendingOutput();
  LOG(INFO) << "Terminating terminal " << id << ", final snapshot is "
            << screenModel->serialize().length() << " bytes";
  if (fanOutSubscription) {
    fanOutSubscription->cancel();
    fanOutSubscription.reset();
  }
  state = SessionState::TERMINATING;
  process->kill();
}

void Session::onProcessData(const string& chunk) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  switch (state) {
    case SessionState::RUNNING_ATTACHED:
      if (!multiplexer->fanOut(fanOutSubscription, chunk)) {
        detachLocked("transport write failed");
      }
      break;
    case SessionState::RUNNING_UNATTACHED:
      bufferOutput(chunk);
      break;
    case SessionState::TERMINATING:
      multiplexer->commit(chunk);
      break;
    case SessionState::TERMINATED:
      break;
  }
}

void Session::bufferOutput(const string& chunk) {
  outputBuffer.append(chunk);
  if (int64_t(outputBuffer.length() - committedLength) > maxBufferBytes) {
    VLOG(1) << "Compacting output buffer of terminal " << id;
    commitPendingOutput();
    outputBuffer = screenModel->serialize();
    committedLength = outputBuffer.length();
  }
}

void Session::commitPendingOutput() {
  if (committedLength < outputBuffer.length()) {
    multiplexer->commit(outputBuffer.substr(committedLength));
    committedLength = outputBuffer.length();
  }
}

void Session::onProcessExit(int code) {
  shared_ptr<Transport> transport;
  TeardownCallback callback;
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (state == SessionState::TERMINATED) {
      return;
    }
    LOG(INFO) << "Terminal " << id << " exited with code " << code;
    exitCode = code;
    transport = attachedTransport.lock();
    attachedTransport.reset();
    if (fanOutSubscription) {
      fanOutSubscription->cancel();
      fanOutSubscription.reset();
    }
    if (dataSubscription) {
      dataSubscription->cancel();
    }
    multiplexer.reset();
    screenModel.reset();
    outputBuffer.clear();
    committedLength = 0;
    state = SessionState::TERMINATED;
    callback = teardownCallback;
    teardownCallback = nullptr;
  }
  if (transport) {
    try {
      transport->sendEndOfStream(code);
    } catch (const TransportWriteFailure& twf) {
      VLOG(1) << "Could not send end of stream to " << transport->getId()
              << ": " << twf.what();
    }
  }
  if (callback) {
    callback(id);
  }
}

SessionState Session::getState() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return state;
}

int Session::getColumns() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return columns;
}

int Session::getRows() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return rows;
}

size_t Session::bufferedBytes() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return outputBuffer.length();
}

bool Session::isAttached() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return state == SessionState::RUNNING_ATTACHED;
}

string Session::snapshot() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (!screenModel) {
    throw SessionGone(id);
  }
  commitPendingOutput();
  return screenModel->serialize();
}

optional<int> Session::getExitCode() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return exitCode;
}
}  // namespace tb
