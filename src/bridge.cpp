#include "bridge.hpp"

#include <algorithm>      // std::min
#include <sstream>        // decode_pretty line assembly
#include <iomanip>        // hex dump of unknown tags


namespace meshz {
// ============================================================================
// Low-level helpers
// ============================================================================

// ---------------------------------------------------------------------------
// Start a new frame: [verb][0][seq][tlv_len placeholder].
// ---------------------------------------------------------------------------
static inline std::vector<uint8_t> header(uint8_t verb, uint8_t seq) {
    std::vector<uint8_t> b;
    b.reserve(64);
    b.push_back(verb);
    b.push_back(0);                    // reserved
    b.push_back(seq);
    b.push_back(0);                    // TLV length (filled by finalize)
    return b;
}

static inline void add_tlv_bytes(std::vector<uint8_t>& b,
                                 uint8_t tag,
                                 const uint8_t* p,
                                 uint8_t len) {
    b.push_back(tag);
    b.push_back(len);
    if (len)
        b.insert(b.end(), p, p + len);
}

static inline void add_tlv_i16(std::vector<uint8_t>& b, uint8_t tag, int16_t v) {
    const uint16_t u = static_cast<uint16_t>(v);
    uint8_t x[2] = { static_cast<uint8_t>(u & 0xFF),
                     static_cast<uint8_t>(u >> 8) };
    add_tlv_bytes(b, tag, x, 2);
}

static inline void add_tlv_str(std::vector<uint8_t>& b, uint8_t tag, const std::string& s) {
    // TLV length is one byte.
    const uint8_t L = static_cast<uint8_t>(std::min<size_t>(s.size(), 255));
    add_tlv_bytes(b, tag, reinterpret_cast<const uint8_t*>(s.data()), L);
}

// ---------------------------------------------------------------------------
// Backfill tlv_len. Saturates at 255 (see header comment in bridge.hpp).
// ---------------------------------------------------------------------------
static inline void finalize(std::vector<uint8_t>& b) {
    b[3] = static_cast<uint8_t>(std::min<size_t>(b.size() - BRIDGE_HEADER, 255));
}

// ============================================================================
// Builders
// ============================================================================

std::vector<uint8_t> make_send_text(uint8_t seq, const std::string& peer, const std::string& text) {
    auto b = header(SEND_TEXT, seq);
    add_tlv_str(b, TAG_PEER, peer);
    add_tlv_str(b, TAG_TEXT, text);
    finalize(b);
    return b;
}

std::vector<uint8_t> make_get_peers(uint8_t seq) {
    auto b = header(GET_PEERS, seq);
    finalize(b);
    return b;
}

std::vector<uint8_t> make_recv_text(uint8_t seq, const std::string& peer, const std::string& text) {
    auto b = header(RECV_TEXT, seq);
    add_tlv_str(b, TAG_PEER, peer);
    add_tlv_str(b, TAG_TEXT, text);
    finalize(b);
    return b;
}

std::vector<uint8_t> make_peer_entry(uint8_t seq, const std::string& peer,
                                     const std::string& name, int16_t snr_db10) {
    auto b = header(PEER_ENTRY, seq);
    add_tlv_str(b, TAG_PEER, peer);
    if (!name.empty()) add_tlv_str(b, TAG_NAME, name);
    add_tlv_i16(b, TAG_SNR_DB10, snr_db10);
    finalize(b);
    return b;
}

std::vector<uint8_t> make_response(bool ok, uint8_t seq, const std::string& error) {
    auto b = header(ok ? RESP_OK : RESP_ERR, seq);
    if (!error.empty()) add_tlv_str(b, TAG_ERROR, error);
    finalize(b);
    return b;
}

// ============================================================================
// Decode
// ============================================================================

const Tlv* BridgeFrame::find(uint8_t tag) const {
    for (const auto& t : tlvs)
        if (t.tag == tag) return &t;
    return nullptr;
}

std::string BridgeFrame::str(uint8_t tag) const {
    const Tlv* t = find(tag);
    return t ? t->val : std::string();
}

// ---------------------------------------------------------------------------
// parse_frame()
// -------------
// Walk [tag][len][value] records. Unlike a pretty-printer we are strict: a
// record that runs past the section is an error, not a silent stop.
// ---------------------------------------------------------------------------
bool parse_frame(const std::vector<uint8_t>& f, BridgeFrame& out) {
    out = BridgeFrame{};
    if (f.size() < BRIDGE_HEADER) return false;

    out.verb = f[0];
    out.seq  = f[2];

    const size_t tl = f[3];
    const size_t end = (tl == 255) ? f.size()                       // saturated: to frame end
                                   : BRIDGE_HEADER + tl;
    if (end > f.size()) return false;

    size_t off = BRIDGE_HEADER;
    while (off < end) {
        if (off + 2 > end) return false;
        const uint8_t tag = f[off++];
        const uint8_t len = f[off++];
        if (off + len > end) return false;
        out.tlvs.push_back({
            tag,
            std::string(reinterpret_cast<const char*>(f.data() + off), len)
        });
        off += len;
    }
    return true;
}

bool tlv_i16(const Tlv& t, int16_t& out) {
    if (t.val.size() != 2) return false;
    const uint16_t u = static_cast<uint16_t>(
        static_cast<uint16_t>(static_cast<uint8_t>(t.val[0])) |
       (static_cast<uint16_t>(static_cast<uint8_t>(t.val[1])) << 8));
    out = static_cast<int16_t>(u);
    return true;
}

const char* verb_name(uint8_t verb) {
    switch (verb) {
        case SEND_TEXT:  return "send_text";
        case RECV_TEXT:  return "recv_text";
        case GET_PEERS:  return "get_peers";
        case PEER_ENTRY: return "peer_entry";
        case RESP_OK:    return "resp_ok";
        case RESP_ERR:   return "resp_err";
        default:         return "unknown";
    }
}

// ============================================================================
// decode_pretty()
// ---------------------------------------------------------------------------
// Output examples:
//   "status=ok seq=1"
//   "status=error seq=4 reason=no_route"
//   "verb=recv_text seq=0 peer=!a1b2c3d4 text=MESHZ_ACK"
//   "status=error reason=bad_frame"
// ============================================================================

std::string decode_pretty(const std::vector<uint8_t>& f) {
    std::ostringstream os;

    BridgeFrame bf;
    if (!parse_frame(f, bf)) {
        os << "status=error reason=bad_frame";
        return os.str();
    }

    if (bf.verb == RESP_OK)       os << "status=ok";
    else if (bf.verb == RESP_ERR) os << "status=error";
    else                          os << "verb=" << verb_name(bf.verb);

    os << " seq=" << unsigned(bf.seq);

    for (const auto& t : bf.tlvs) {
        switch (t.tag) {
            case TAG_PEER:  os << " peer=" << t.val; break;
            case TAG_TEXT:  os << " text=" << t.val; break;
            case TAG_NAME:  os << " name=" << t.val; break;
            case TAG_ERROR: os << " reason=" << t.val; break;
            case TAG_SNR_DB10: {
                int16_t v;
                if (tlv_i16(t, v)) os << " snr_db=" << (v / 10.0);
                break;
            }
            default: {
                os << " tag" << unsigned(t.tag) << "=0x";
                std::ios_base::fmtflags f0 = os.flags();
                char fill0 = os.fill();
                for (unsigned char c : t.val)
                    os << std::hex << std::setw(2) << std::setfill('0') << unsigned(c);
                os.flags(f0);
                os.fill(fill0);
                break;
            }
        }
    }

    return os.str();
}

} // namespace meshz
