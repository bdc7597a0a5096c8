// ============================================================================
// link_serial.cpp — SerialLink (ILink over the serial bridge)
// For the contract see include/meshz/link/link_base.hpp.
// ============================================================================

#include "meshz/link/link_serial.hpp"
#include "bridge.hpp"
#include "serial_io.hpp"

#include <utility>

namespace meshz::link {

// Queued RECV_TEXT frames beyond this are dropped; the Core inbox is smaller anyway.
static constexpr size_t PENDING_CAP = 128;

SerialLink::SerialLink(SerialConfig cfg) : cfg_(std::move(cfg)) {}

SerialLink::~SerialLink() { close(); }

bool SerialLink::open() {
  if (fd_ >= 0) return true;
  if (cfg_.path.empty()) return false;
  fd_ = open_serial(cfg_.path, cfg_.baud, cfg_.boot_delay_ms);
  return fd_ >= 0;
}

void SerialLink::close() {
  close_serial(fd_);
  fd_ = -1;
}

uint8_t SerialLink::next_seq() {
  std::lock_guard<std::mutex> lk(mu_);
  return ++seq_;
}

TxResult SerialLink::send(const PeerId& to, const char* text) {
  if (fd_ < 0 || to.empty() || !text) return TxResult::Error;
  auto frame = make_send_text(next_seq(), std::string(to.c_str()), std::string(text));
  if (cfg_.trace) cfg_.trace("tx " + decode_pretty(frame));
  std::lock_guard<std::mutex> lk(tx_mu_);
  return write_frame(fd_, frame) ? TxResult::Ok : TxResult::Error;
}

bool SerialLink::refresh_peers() {
  if (fd_ < 0) return false;
  auto frame = make_get_peers(next_seq());
  if (cfg_.trace) cfg_.trace("tx " + decode_pretty(frame));
  std::lock_guard<std::mutex> lk(tx_mu_);
  return write_frame(fd_, frame);
}

// ---------------------------------------------------------------------------
// recv()
// ------
// Pull whatever the port has, sort the frames, then hand back one text frame.
// ---------------------------------------------------------------------------
RxResult SerialLink::recv(Inbound& out) {
  if (fd_ < 0) return RxResult::Error;

  std::vector<std::vector<uint8_t>> frames;
  bool ok;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ok = read_frames(fd_, dec_, frames, 0);
  }
  for (const auto& f : frames) handle_frame(f);

  std::lock_guard<std::mutex> lk(mu_);
  if (!pending_.empty()) {
    out = pending_.front();
    pending_.pop_front();
    return RxResult::Ok;
  }
  return ok ? RxResult::None : RxResult::Error;
}

void SerialLink::handle_frame(const std::vector<uint8_t>& raw) {
  if (cfg_.trace) cfg_.trace("rx " + decode_pretty(raw));
  BridgeFrame f;
  if (!parse_frame(raw, f)) return;                      // line noise

  std::lock_guard<std::mutex> lk(mu_);
  switch (f.verb) {
    case RECV_TEXT: {
      Inbound in;
      const std::string peer = f.str(TAG_PEER);
      const std::string text = f.str(TAG_TEXT);
      if (!copy_bounded(in.from, peer.c_str()) || !copy_bounded(in.text, text.c_str())) return;
      if (pending_.size() < PENDING_CAP) pending_.push_back(in);
      break;
    }
    case PEER_ENTRY: {
      PeerInfo p;
      p.id = f.str(TAG_PEER);
      if (p.id.empty()) return;
      p.name = f.str(TAG_NAME);
      int16_t snr10 = 0;
      if (const Tlv* t = f.find(TAG_SNR_DB10); t && tlv_i16(*t, snr10)) p.snr_db = snr10 / 10.0;
      peers_[p.id] = p;
      break;
    }
    case RESP_ERR:
      last_error_ = f.str(TAG_ERROR);
      if (last_error_.empty()) last_error_ = "unspecified";
      break;
    default:
      break;                                             // RESP_OK and unknown verbs
  }
}

std::vector<PeerInfo> SerialLink::peers() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<PeerInfo> out;
  out.reserve(peers_.size());
  for (const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

std::string SerialLink::last_error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_error_;
}

} // namespace meshz::link
