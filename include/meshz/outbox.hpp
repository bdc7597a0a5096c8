/**
 * @file outbox.hpp
 * @brief Outbox type and the small builders the state machines use to fill it.
 *
 * @details
 * The sender, the receiver and the watchdog all write into the Core's single
 * fixed-capacity outbox. They see it as `etl::ideque<Action>` (the ETL
 * capacity-erased base) so they do not depend on the Core's chosen capacity.
 *
 * Pushing into a full outbox drops the action, same policy as the Core's
 * other bounded queues: memory stays fixed and the next tick carries on.
 */
#ifndef MESHZ_OUTBOX_HPP
#define MESHZ_OUTBOX_HPP

#include <stdint.h>
#include <utility>
#include "etl/deque.h"
#include "meshz/action.hpp"
#include "meshz/frame.hpp"

namespace meshz {

using Outbox = etl::ideque<Action>;

/**
 * @brief Heap-free line builder for log text.
 *
 * @code
 *   Line l; l << "chunk " << idx << "/" << total;
 *   push_log(outbox, LogLevel::Info, l.str());
 * @endcode
 *
 * Text beyond 255 characters is cut off.
 */
class Line {
public:
  Line& operator<<(const char* s) { if (s) s_.append(s); return *this; }
  Line& operator<<(const etl::istring& s) { s_.append(s); return *this; }
  Line& operator<<(uint64_t n) {
    char buf[20];
    int idx = 0;
    do { buf[idx++] = static_cast<char>('0' + (n % 10)); n /= 10; } while (n > 0);
    for (int i = idx - 1; i >= 0; --i) s_.push_back(buf[i]);
    return *this;
  }
  const Text255& str() const { return s_; }
private:
  Text255 s_;
};

inline void push(Outbox& out, Action&& a) {
  if (!out.full()) out.push_back(std::move(a));         // full → drop
}

inline void push_log(Outbox& out, LogLevel level, const etl::istring& text) {
  Action a;
  a.kind = ActionKind::Log;
  a.level = level;
  a.text = text;
  push(out, std::move(a));
}

inline void push_progress(Outbox& out, uint32_t current, uint32_t total, const char* label) {
  Action a;
  a.kind = ActionKind::Progress;
  a.current = current;
  a.total = total;
  copy_bounded(a.label, label);
  push(out, std::move(a));
}

inline void push_progress_done(Outbox& out) {
  Action a;
  a.kind = ActionKind::ProgressDone;
  push(out, std::move(a));
}

inline void push_transfer_done(Outbox& out, bool ok, const etl::istring& text) {
  Action a;
  a.kind = ActionKind::TransferDone;
  a.ok = ok;
  a.text = text;
  push(out, std::move(a));
}

/// Encode @p f and queue it for @p to. Returns false if the frame did not encode.
inline bool push_frame(Outbox& out, const PeerId& to, const Frame& f) {
  Action a;
  a.kind = ActionKind::SendText;
  a.peer = to;
  if (!encode(f, a.text)) return false;
  push(out, std::move(a));
  return true;
}

} // namespace meshz

#endif // MESHZ_OUTBOX_HPP
