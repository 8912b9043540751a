#ifndef __TB_SUBSCRIPTION__
#define __TB_SUBSCRIPTION__

#include "Headers.hpp"

namespace tb {
/**
 * @brief Cancelable handle returned by every event source in the bridge.
 *
 * Cancelling is permanent. The flag is atomic because the event source reads
 * it from its own thread.
 */
class Subscription {
 public:
  Subscription() : active(true) {}
  virtual ~Subscription() {}

  virtual void cancel() { active = false; }
  bool isActive() const { return active; }

 protected:
  std::atomic<bool> active;
};
}  // namespace tb

#endif  // __TB_SUBSCRIPTION__
