#pragma once
/**
 * @file link_base.hpp
 * @brief What MeshZ needs from the mesh: send text to a peer, receive text, list peers.
 *
 * Header-only. The Station owns one ILink for its whole life and is its only
 * user: the I/O worker calls send(), the station loop calls recv().
 */

#include <cstdint>
#include <string>
#include <vector>
#include "meshz/types.hpp"

namespace meshz::link {

enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/// One peer the link can currently reach.
struct PeerInfo {
  std::string id;        // e.g. "!a1b2c3d4"
  std::string name;      // display name; may be empty
  double      snr_db{0}; // last signal quality
};

/**
 * @brief Link Adapter contract.
 *
 *  - open() brings the link up; false means the link is unavailable.
 *  - send(to, text) hands one text frame to the mesh. Busy may be retried.
 *  - recv(out) never blocks: Ok with a frame, None if nothing is waiting.
 *    Error means the link went away.
 *  - refresh_peers() asks the mesh who is around; answers show up in peers()
 *    later, as recv() is serviced.
 *  - send() and recv() may be called from different threads.
 */
class ILink {
public:
  virtual ~ILink() = default;
  virtual bool      open() = 0;
  virtual void      close() = 0;
  virtual TxResult  send(const PeerId& to, const char* text) = 0;
  virtual RxResult  recv(Inbound& out) = 0;
  virtual bool      refresh_peers() = 0;
  virtual std::vector<PeerInfo> peers() const = 0;
  virtual const char* name() const = 0;
};

} // namespace meshz::link
