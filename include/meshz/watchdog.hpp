/**
 * @file watchdog.hpp
 * @brief Periodic liveness check for the sender (retry/abort) and receiver (stall).
 *
 * @details
 * The Watchdog has no thread and no timer of its own. `Core::tick()` calls
 * `poll()` every time; the Watchdog decides whether a full interval of tick
 * time has passed and, if so, runs one check. Because the Core is the only
 * caller and ticks are serialized, two checks can never overlap.
 *
 * The interval is measured from tick time 0, so the first tick at or past
 * `watchdog_interval_ms` runs a check.
 *
 * Sender rule, once per interval, only while a chunk is in flight:
 * - elapsed since last ack <= ack timeout: nothing.
 * - retries < max: count a retry and resend the same chunk. The last-ack
 *   time is NOT moved, so the next interval fires again if still silent.
 * - otherwise: the session fails.
 */
#ifndef MESHZ_WATCHDOG_HPP
#define MESHZ_WATCHDOG_HPP

#include <stdint.h>
#include "meshz/settings.hpp"
#include "meshz/sender.hpp"
#include "meshz/receiver.hpp"

namespace meshz {

class Watchdog {
public:
  explicit Watchdog(const Settings& settings);

  /// Run the check if an interval has passed. Returns true if it ran.
  bool poll(uint32_t now_ms, TransferCoordinator& sender, ReceiverAssembler& receiver);

  uint32_t checks_run() const { return checks_; }

private:
  void check_sender(uint32_t now_ms, TransferCoordinator& sender);

  const Settings& settings_;
  uint32_t last_check_ms_{0};
  uint32_t checks_{0};
};

} // namespace meshz

#endif // MESHZ_WATCHDOG_HPP
