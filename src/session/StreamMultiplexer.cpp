#include "StreamMultiplexer.hpp"

#include "BridgeErrors.hpp"

namespace tb {
StreamMultiplexer::StreamMultiplexer(shared_ptr<ProcessHandle> _process,
                                     shared_ptr<ScreenModel> _screen)
    : process(_process), screen(_screen) {}

shared_ptr<FanOutSubscription> StreamMultiplexer::subscribe(
    const shared_ptr<Transport>& transport) {
  VLOG(1) << "Fanning out process " << process->getId() << " to "
          << transport->getId();
  return make_shared<FanOutSubscription>(transport);
}

bool StreamMultiplexer::fanOut(
    const shared_ptr<FanOutSubscription>& subscription, const string& chunk) {
  screen->write(chunk);
  if (!subscription || !subscription->isActive()) {
    return false;
  }
  auto transport = subscription->getTransport();
  if (!transport) {
    VLOG(1) << "Transport " << subscription->getTransportId()
            << " is gone";
    subscription->cancel();
    return false;
  }
  try {
    transport->send(chunk);
  } catch (const TransportWriteFailure& twf) {
    LOG(INFO) << "Write to " << subscription->getTransportId()
              << " failed: " << twf.what();
    subscription->cancel();
    return false;
  }
  return true;
}

void StreamMultiplexer::commit(const string& bytes) { screen->write(bytes); }

void StreamMultiplexer::fanIn(const string& bytes) { process->write(bytes); }
}  // namespace tb
