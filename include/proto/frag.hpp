#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

/*
TX (phone):
segmenter.send(text)
  -> make_chunks(msg_id, text, fragment_bytes)   // UTF-8 safe cuts
     -> one Chunk at a time (window = 1):
          serialize(Chunk)  // [13B header][payload]
            -> transport.send(frame)
          wait for ACK(seq >= i) or tick() timeout -> resend

RX (watch):
transport.on_rx(frame)
  -> parse(frame)
      -> DATA ? reassembler.on_fragment(Chunk) -> ACK(expected - 1) -> transport.send
      -> ACK  ? segmenter.on_ack(Chunk)
*/

namespace frag
{

// --- Protocol constants ---
inline constexpr std::uint8_t PROTO_VER = 1;

inline constexpr std::uint8_t KIND_DATA = 0x01;
inline constexpr std::uint8_t KIND_ACK  = 0x02;

inline constexpr std::uint8_t FLAG_FINAL   = 1 << 0;  // DATA: last fragment of the message
inline constexpr std::uint8_t FLAG_RETRANS = 1 << 1;  // DATA: resent after a timeout
inline constexpr std::uint8_t FLAG_REJECT  = 1 << 2;  // ACK: receiver refused the message

inline constexpr std::size_t HDR_SIZE    = 13;
inline constexpr std::size_t MAX_PAYLOAD = 512;  // upper bound for fragment_bytes
inline constexpr std::size_t MIN_PAYLOAD = 4;    // one UTF-8 code point always fits
inline constexpr std::size_t MAX_FRAME   = HDR_SIZE + MAX_PAYLOAD;

// On-wire header, big-endian
struct Header
{
    std::uint8_t  ver{PROTO_VER};  // 1B
    std::uint8_t  kind{KIND_DATA}; // 1B
    std::uint8_t  flags{0};        // 1B
    std::uint32_t msg_id{0};       // 4B
    std::uint16_t seq{0};          // 2B  fragment index, or cumulative index for ACK
    std::uint16_t total{0};        // 2B
    std::uint16_t len{0};          // 2B
};

struct Chunk
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;

    bool is_data() const { return hdr.kind == KIND_DATA; }
    bool is_ack() const { return hdr.kind == KIND_ACK; }
    bool is_final() const { return (hdr.flags & FLAG_FINAL) != 0; }
};

// TX
std::vector<Chunk>        make_chunks(std::uint32_t    msg_id,
                                      std::string_view text,
                                      std::size_t      fragment_bytes);
Chunk                     make_ack(std::uint32_t msg_id,
                                   std::uint16_t seq,
                                   std::uint16_t total,
                                   bool          reject = false);
std::vector<std::uint8_t> serialize(const Chunk &c);
bool                      pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);
// RX
std::optional<Chunk>      parse(const std::vector<std::uint8_t> &frame);
bool                      unpack_header(const std::uint8_t in[HDR_SIZE], Header &out);

}  // namespace frag
