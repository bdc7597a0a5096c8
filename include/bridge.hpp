/**
 * @file bridge.hpp
 * @brief Bridge protocol: the frames exchanged with the radio node over serial.
 *
 * @details
 * PURPOSE
 * -------
 * MeshZ never drives a radio directly. A radio node hangs off a USB serial
 * port and carries text for us. This file is the contract with that node:
 * "send this text to that peer", "here is text a peer sent you", "who can
 * you hear?". Everything is a small binary frame, SLIP-wrapped by serial_io.
 *
 * FRAME LAYOUT
 * ------------
 *   [verb][0][seq][tlv_len] [tag][len][value...] [tag][len][value...] ...
 *
 * - verb:    what the frame is (table below).
 * - byte 1:  reserved, always 0.
 * - seq:     host-chosen sequence number; replies echo it.
 * - tlv_len: length of the TLV section. It saturates at 255: a text TLV
 *            plus a peer TLV can exceed that, and a value of 255 then means
 *            "TLVs run to the end of the SLIP frame".
 *
 * VERBS
 * -----
 * | Verb        | Value | Direction   | TLVs                                   |
 * |-------------|-------|-------------|----------------------------------------|
 * | SEND_TEXT   | 0x20  | host → node | TAG_PEER, TAG_TEXT                     |
 * | RECV_TEXT   | 0x21  | node → host | TAG_PEER, TAG_TEXT                     |
 * | GET_PEERS   | 0x22  | host → node | none                                   |
 * | PEER_ENTRY  | 0x23  | node → host | TAG_PEER, TAG_NAME, TAG_SNR_DB10       |
 * | RESP_OK     | 0x90  | node → host | optional TAG_ERROR (unused)            |
 * | RESP_ERR    | 0x91  | node → host | optional TAG_ERROR                     |
 *
 * GET_PEERS is answered with one PEER_ENTRY per peer the node knows, then a
 * RESP_OK carrying the same seq.
 *
 * Integers are little-endian. Strings are raw bytes, not null-terminated,
 * at most 255 per TLV.
 *
 * OUTPUT
 * ------
 * `decode_pretty()` turns any frame into one `key=value` line so logs and
 * shell scripts can read node traffic:
 *
 *   status=ok seq=4
 *   verb=recv_text seq=0 peer=!a1b2c3d4 text=MESHZ_ACK
 *   verb=peer_entry seq=7 peer=!a1b2c3d4 name=ridge snr_db=6.5
 */
#pragma once

#include <vector>
#include <string>
#include <cstdint>

namespace meshz {

// =============================== Verbs ===============================
enum : uint8_t {
    SEND_TEXT  = 0x20,  /**< host asks the node to send text to a peer */
    RECV_TEXT  = 0x21,  /**< node reports text received from a peer */
    GET_PEERS  = 0x22,  /**< host asks for the node's peer list */
    PEER_ENTRY = 0x23,  /**< node reports one peer */

    RESP_OK    = 0x90,  /**< request accepted */
    RESP_ERR   = 0x91   /**< request refused; TAG_ERROR may say why */
};

// ============================== TLV Tags =============================
enum : uint8_t {
    TAG_PEER     = 0x01, /**< string: peer id (e.g. "!a1b2c3d4") */
    TAG_TEXT     = 0x02, /**< string: text payload, one MeshZ frame */
    TAG_NAME     = 0x03, /**< string: peer display name */
    TAG_SNR_DB10 = 0x04, /**< i16   : last SNR in 0.1 dB units (65 -> 6.5 dB) */
    TAG_ERROR    = 0x05  /**< string: short reason for RESP_ERR */
};

/// Header bytes in front of the TLVs.
static constexpr size_t BRIDGE_HEADER = 4;

/// One decoded TLV; `val` holds the raw value bytes.
struct Tlv {
    uint8_t     tag;
    std::string val;
};

/// A bridge frame split into its parts.
struct BridgeFrame {
    uint8_t verb = 0;
    uint8_t seq  = 0;
    std::vector<Tlv> tlvs;

    /// First TLV with @p tag, or nullptr.
    const Tlv* find(uint8_t tag) const;

    /// String value of @p tag, or empty if absent.
    std::string str(uint8_t tag) const;
};

// ========================= Builders =========================

/// SEND_TEXT: deliver @p text to @p peer.
std::vector<uint8_t> make_send_text(uint8_t seq, const std::string& peer, const std::string& text);

/// GET_PEERS: ask for the roster (no TLVs).
std::vector<uint8_t> make_get_peers(uint8_t seq);

/// RECV_TEXT as the node sends it. Used by loopback tests and bench tools.
std::vector<uint8_t> make_recv_text(uint8_t seq, const std::string& peer, const std::string& text);

/// PEER_ENTRY as the node sends it.
std::vector<uint8_t> make_peer_entry(uint8_t seq, const std::string& peer,
                                     const std::string& name, int16_t snr_db10);

/// RESP_OK / RESP_ERR. @p error is attached as TAG_ERROR when non-empty.
std::vector<uint8_t> make_response(bool ok, uint8_t seq, const std::string& error = "");

// ========================= Decode =========================

/**
 * @brief Split a raw frame into verb, seq and TLVs.
 * @return false if the header is short or a TLV runs past the end.
 */
bool parse_frame(const std::vector<uint8_t>& frame, BridgeFrame& out);

/// Little-endian i16 from a 2-byte TLV value.
bool tlv_i16(const Tlv& t, int16_t& out);

/// Short lowercase verb name (`"send_text"`, `"resp_ok"`, ...).
const char* verb_name(uint8_t verb);

/// One `key=value` line describing @p frame.
std::string decode_pretty(const std::vector<uint8_t>& frame);

} // namespace meshz
