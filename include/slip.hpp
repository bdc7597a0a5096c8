#pragma once

/**
 * @file slip.hpp
 * @brief SLIP framing (RFC 1055) for the serial bridge to the radio node.
 *
 * @details
 * The serial line between the host and the radio node is a plain byte
 * stream. SLIP puts boundaries back into it: every bridge frame (verb + TLVs,
 * see bridge.hpp) travels wrapped as `END payload END`, with the two special
 * bytes escaped inside the payload.
 *
 * | Byte in payload | On the wire      |
 * |-----------------|------------------|
 * | 0xC0 (END)      | 0xDB 0xDC        |
 * | 0xDB (ESC)      | 0xDB 0xDD        |
 * | anything else   | itself           |
 *
 * A leading END is sent as well as the trailing one. Line noise picked up
 * while the port was idle then ends up in an empty or garbage frame that the
 * decoder throws away, instead of being glued to the front of a real one.
 *
 * @par Decoder
 * `slip::decoder` is a byte-at-a-time state machine. It keeps its state
 * between calls, so a frame split across several `read()`s is reassembled.
 * A malformed escape or a frame longer than `max_len` drops the partial
 * frame; the decoder then waits for the next END.
 */

#include <vector>
#include <cstdint>
#include <cstddef>

namespace meshz {
namespace slip {

static constexpr uint8_t END     = 0xC0;  ///< frame delimiter
static constexpr uint8_t ESC     = 0xDB;  ///< escape introducer
static constexpr uint8_t ESC_END = 0xDC;  ///< ESC ESC_END = literal END
static constexpr uint8_t ESC_ESC = 0xDD;  ///< ESC ESC_ESC = literal ESC

/// Largest payload the decoder accepts by default (bridge frames are far smaller).
static constexpr size_t MAX_FRAME = 1024;

/**
 * @brief Wrap @p n bytes at @p in into one SLIP frame (replaces @p out).
 */
inline void encode(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(n * 2 + 2);            // worst case: every byte escaped

    out.push_back(END);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = in[i];
        if (b == END) {
            out.push_back(ESC);
            out.push_back(ESC_END);
        } else if (b == ESC) {
            out.push_back(ESC);
            out.push_back(ESC_ESC);
        } else {
            out.push_back(b);
        }
    }
    out.push_back(END);
}

/**
 * @brief Streaming SLIP decoder.
 *
 * @code
 * meshz::slip::decoder dec;
 * std::vector<uint8_t> frame;
 * for (uint8_t b : bytes_from_port)
 *     if (dec.feed(b, frame)) handle(frame);
 * @endcode
 */
struct decoder {
    std::vector<uint8_t> buf;      ///< payload collected so far
    bool esc = false;              ///< previous byte was ESC
    bool in_frame = false;         ///< an END opened a frame
    size_t max_len = MAX_FRAME;    ///< longer frames are dropped
    uint32_t dropped = 0;          ///< frames thrown away (bad escape / too long)

    /**
     * @brief Feed one byte.
     * @return true if @p frame now holds one complete non-empty payload.
     */
    bool feed(uint8_t b, std::vector<uint8_t>& frame) {
        if (b == END) {
            esc = false;
            if (in_frame && !buf.empty()) {
                frame.swap(buf);
                buf.clear();               // this END also opens the next frame
                return true;
            }
            buf.clear();               // empty frame or noise: start over
            in_frame = true;
            return false;
        }

        if (!in_frame) return false;   // wait for an END to sync

        if (esc) {
            esc = false;
            if      (b == ESC_END) b = END;
            else if (b == ESC_ESC) b = ESC;
            else { drop(); return false; }
        } else if (b == ESC) {
            esc = true;
            return false;
        }

        if (buf.size() >= max_len) { drop(); return false; }
        buf.push_back(b);
        return false;
    }

    /// Forget any partial frame.
    void reset() {
        buf.clear();
        esc = false;
        in_frame = false;
    }

private:
    void drop() {
        reset();
        ++dropped;
    }
};

} // namespace slip
} // namespace meshz
