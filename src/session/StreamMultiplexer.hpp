#ifndef __TB_STREAM_MULTIPLEXER__
#define __TB_STREAM_MULTIPLEXER__

#include "ProcessHandle.hpp"
#include "ScreenModel.hpp"
#include "Subscription.hpp"
#include "Transport.hpp"

namespace tb {
/**
 * @brief Routing of live output from a process to one transport.  Holds the
 * transport weakly so a dropped connection never outlives its owner.
 */
class FanOutSubscription : public Subscription {
 public:
  explicit FanOutSubscription(const shared_ptr<Transport>& _transport)
      : transport(_transport), transportId(_transport->getId()) {}

  shared_ptr<Transport> getTransport() const { return transport.lock(); }
  const string& getTransportId() const { return transportId; }

 protected:
  weak_ptr<Transport> transport;
  string transportId;
};

/**
 * @brief Fans process output into the screen model and the attached
 * transport, and fans client input back into the process.
 *
 * The multiplexer does no locking; the owning Session serializes calls.
 */
class StreamMultiplexer {
 public:
  StreamMultiplexer(shared_ptr<ProcessHandle> _process,
                    shared_ptr<ScreenModel> _screen);

  shared_ptr<FanOutSubscription> subscribe(
      const shared_ptr<Transport>& transport);

  /**
   * @brief Commits `chunk` to the screen model, then forwards it.
   *
   * Returns false (and cancels the subscription) when the transport is gone
   * or the write failed.  The chunk is committed either way.
   */
  bool fanOut(const shared_ptr<FanOutSubscription>& subscription,
              const string& chunk);

  /** @brief Commits bytes to the screen model without forwarding them. */
  void commit(const string& bytes);

  /** @brief Forwards client input to the process. */
  void fanIn(const string& bytes);

 protected:
  shared_ptr<ProcessHandle> process;
  shared_ptr<ScreenModel> screen;
};
}  // namespace tb

#endif  // __TB_STREAM_MULTIPLEXER__
