#pragma once
/**
 * @file link_serial.hpp
 * @brief ILink over a USB serial radio node speaking the bridge protocol.
 *
 * Linux-only (termios). Frames are SLIP-wrapped bridge frames, see bridge.hpp.
 *
 * recv() services the port: RECV_TEXT frames are queued for the caller,
 * PEER_ENTRY frames update the roster, RESP_ERR frames are remembered in
 * last_error(). Replies are not waited for; send() returns as soon as the
 * frame is written. With a trace callback set, every frame in either
 * direction is also reported as one decode_pretty() line.
 */

#if !defined(__linux__)
#  error "link_serial.hpp is Linux-only."
#endif

#include "meshz/link/link_base.hpp"
#include "slip.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace meshz::link {

struct SerialConfig {
  std::string path;          // e.g. /dev/serial/by-id/usb-...
  int baud{115200};
  int boot_delay_ms{400};
  std::function<void(const std::string&)> trace;   // "tx ..."/"rx ..." per bridge frame; may be empty
};

class SerialLink : public ILink {
public:
  explicit SerialLink(SerialConfig cfg);
  ~SerialLink() override;

  SerialLink(const SerialLink&) = delete;
  SerialLink& operator=(const SerialLink&) = delete;

  bool      open() override;
  void      close() override;
  TxResult  send(const PeerId& to, const char* text) override;
  RxResult  recv(Inbound& out) override;
  bool      refresh_peers() override;
  std::vector<PeerInfo> peers() const override;
  const char* name() const override { return "serial-bridge"; }

  const SerialConfig& config() const { return cfg_; }
  std::string last_error() const;

private:
  void handle_frame(const std::vector<uint8_t>& raw);
  uint8_t next_seq();

  SerialConfig cfg_;
  int fd_{-1};

  std::mutex tx_mu_;                      // one writer at a time
  mutable std::mutex mu_;                 // guards everything below
  uint8_t seq_{0};
  slip::decoder dec_;
  std::deque<Inbound> pending_;
  std::map<std::string, PeerInfo> peers_;
  std::string last_error_;
};

} // namespace meshz::link
