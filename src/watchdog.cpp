// watchdog.cpp — interval gating and the retry/abort decision.
// See include/meshz/watchdog.hpp.
#include "meshz/watchdog.hpp"

namespace meshz {

Watchdog::Watchdog(const Settings& settings) : settings_(settings) {}

bool Watchdog::poll(uint32_t now_ms, TransferCoordinator& sender, ReceiverAssembler& receiver) {
  if (now_ms - last_check_ms_ < settings_.watchdog_interval_ms) return false;
  last_check_ms_ = now_ms;
  ++checks_;

  check_sender(now_ms, sender);
  receiver.check_stall(now_ms);
  return true;
}

void Watchdog::check_sender(uint32_t now_ms, TransferCoordinator& sender) {
  if (!sender.awaiting_chunk_ack()) return;

  const TransferSession& s = sender.session();
  const uint32_t elapsed = now_ms - s.last_ack_ms();
  if (elapsed <= settings_.ack_timeout_ms) return;

  if (s.retry_count() < settings_.max_retries) {
    sender.retry_current_chunk();
  } else {
    Line l;
    l << "no ack for chunk " << s.current_chunk() << " after "
      << settings_.max_retries << " retries";
    sender.abort(l.str().c_str());
  }
}

} // namespace meshz
