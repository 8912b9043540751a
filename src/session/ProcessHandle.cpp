#include "ProcessHandle.hpp"

namespace tb {
shared_ptr<Subscription> ProcessHandle::onData(DataCallback callback) {
  auto subscription = make_shared<Subscription>();
  lock_guard<mutex> guard(listenerMutex);
  dataListeners.push_back(make_pair(subscription, callback));
  return subscription;
}

shared_ptr<Subscription> ProcessHandle::onExit(ExitCallback callback) {
  auto subscription = make_shared<Subscription>();
  lock_guard<mutex> guard(listenerMutex);
  exitListeners.push_back(make_pair(subscription, callback));
  return subscription;
}

void ProcessHandle::emitData(const string& data) {
  vector<pair<shared_ptr<Subscription>, DataCallback>> listeners;
  {
    lock_guard<mutex> guard(listenerMutex);
    dataListeners.erase(
        std::remove_if(dataListeners.begin(), dataListeners.end(),
                       [](const pair<shared_ptr<Subscription>, DataCallback>&
                              listener) {
                         return !listener.first->isActive();
                       }),
        dataListeners.end());
    listeners = dataListeners;
  }
  for (auto& listener : listeners) {
    if (listener.first->isActive()) {
      listener.second(data);
    }
  }
}

void ProcessHandle::emitExit(int exitCode) {
  vector<pair<shared_ptr<Subscription>, ExitCallback>> listeners;
  {
    lock_guard<mutex> guard(listenerMutex);
    if (exitEmitted) {
      return;
    }
    exitEmitted = true;
    listeners.swap(exitListeners);
    dataListeners.clear();
  }
  for (auto& listener : listeners) {
    if (listener.first->isActive()) {
      listener.second(exitCode);
    }
  }
}
}  // namespace tb
