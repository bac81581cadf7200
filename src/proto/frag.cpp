#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstdint>
#include <cstring>

#include "proto/frag.hpp"
#include "proto/utf8.hpp"
#include "util/log.hpp"

namespace frag
{

static bool header_ok(const Header &h)
{
    if (h.ver != PROTO_VER)
        return false;
    if (h.kind != KIND_DATA && h.kind != KIND_ACK)
        return false;
    if (h.total == 0)
        return false;
    if (h.seq >= h.total)
        return false;
    if (h.len > MAX_PAYLOAD)
        return false;
    if (h.kind == KIND_ACK)
        return h.len == 0;
    // FINAL must be set exactly on the last index
    const bool final_flag = (h.flags & FLAG_FINAL) != 0;
    return final_flag == (h.seq + 1u == h.total);
}

std::vector<Chunk> make_chunks(std::uint32_t msg_id, std::string_view text, std::size_t fragment_bytes)
{
    if (fragment_bytes < MIN_PAYLOAD || fragment_bytes > MAX_PAYLOAD)
    {
        LOG_ERROR("make_chunks: invalid fragment_bytes (%zu)", fragment_bytes);
        return {};
    }

    // cut offsets first so every chunk knows the total
    std::vector<std::size_t> cuts;
    std::size_t              pos = 0;
    while (pos < text.size())
    {
        pos = utf8::cut_point(text, pos, fragment_bytes);
        cuts.push_back(pos);
    }
    if (cuts.empty())
        cuts.push_back(0);  // empty text -> one empty final fragment

    if (cuts.size() > UINT16_MAX)
    {
        LOG_ERROR("make_chunks: text too large (%zu bytes, needs %zu fragments)", text.size(),
                  cuts.size());
        return {};
    }

    const auto         total = static_cast<std::uint16_t>(cuts.size());
    std::vector<Chunk> out;
    out.reserve(total);
    std::size_t start = 0;
    for (std::uint16_t i = 0; i < total; i++)
    {
        const std::size_t take     = cuts[i] - start;
        const bool        is_final = (i + 1 == total);
        Chunk             c;
        c.hdr.ver    = PROTO_VER;
        c.hdr.kind   = KIND_DATA;
        c.hdr.flags  = is_final ? FLAG_FINAL : 0;
        c.hdr.msg_id = msg_id;
        c.hdr.seq    = i;
        c.hdr.total  = total;
        c.hdr.len    = static_cast<std::uint16_t>(take);
        if (take)
            c.payload.assign(text.begin() + start, text.begin() + cuts[i]);
        out.push_back(std::move(c));
        start = cuts[i];
    }
    return out;
}

Chunk make_ack(std::uint32_t msg_id, std::uint16_t seq, std::uint16_t total, bool reject)
{
    Chunk c;
    c.hdr.ver    = PROTO_VER;
    c.hdr.kind   = KIND_ACK;
    c.hdr.flags  = reject ? FLAG_REJECT : 0;
    c.hdr.msg_id = msg_id;
    c.hdr.seq    = seq;
    c.hdr.total  = total;
    c.hdr.len    = 0;
    return c;
}

std::vector<std::uint8_t> serialize(const Chunk &c)
{
    if (c.payload.size() != c.hdr.len)
    {
        LOG_ERROR("serialize: payload size mismatch (%zu != %u)", c.payload.size(),
                  static_cast<unsigned>(c.hdr.len));
        return {};
    }

    std::vector<std::uint8_t> out(HDR_SIZE + c.payload.size());

    if (!pack_header(c.hdr, out.data()))
    {
        LOG_ERROR("serialize: invalid header (kind=%u seq=%u total=%u)",
                  static_cast<unsigned>(c.hdr.kind), static_cast<unsigned>(c.hdr.seq),
                  static_cast<unsigned>(c.hdr.total));
        return {};
    }

    if (!c.payload.empty())
    {
        std::memcpy(out.data() + HDR_SIZE, c.payload.data(), c.payload.size());
    }
    return out;
}

std::optional<Chunk> parse(const std::vector<std::uint8_t> &frame)
{
    Header h{};
    Chunk  c;
    if (frame.size() < HDR_SIZE)
    {
        LOG_ERROR("parse: frame too short! (%zu)", frame.size());
        return std::nullopt;
    }
    if (!unpack_header(frame.data(), h))
    {
        LOG_ERROR("parse: invalid header, failed to unpack");
        return std::nullopt;
    }

    const std::size_t expected = HDR_SIZE + static_cast<std::size_t>(h.len);
    if (frame.size() != expected)
    {
        LOG_ERROR("parse: size mismatch (got %zu, expect %zu)", frame.size(), expected);
        return std::nullopt;
    }
    c.hdr = h;
    if (h.len)
    {
        c.payload.assign(frame.begin() + HDR_SIZE, frame.end());
    }
    return c;
}

bool pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    if (!header_ok(in))
        return false;

    out[0] = in.ver;
    out[1] = in.kind;
    out[2] = in.flags;

    std::uint32_t msg_id_be = htonl(in.msg_id);
    std::memcpy(out + 3, &msg_id_be, sizeof msg_id_be);

    std::uint16_t seq_be = htons(in.seq);
    std::memcpy(out + 7, &seq_be, sizeof seq_be);

    std::uint16_t total_be = htons(in.total);
    std::memcpy(out + 9, &total_be, sizeof total_be);

    std::uint16_t len_be = htons(in.len);
    std::memcpy(out + 11, &len_be, sizeof len_be);

    return true;
}

bool unpack_header(const std::uint8_t in[HDR_SIZE], Header &out)
{
    out.ver   = in[0];
    out.kind  = in[1];
    out.flags = in[2];

    std::uint32_t msg_id_be;
    std::memcpy(&msg_id_be, in + 3, sizeof msg_id_be);
    out.msg_id = ntohl(msg_id_be);

    std::uint16_t seq_be;
    std::memcpy(&seq_be, in + 7, sizeof seq_be);
    out.seq = ntohs(seq_be);

    std::uint16_t total_be;
    std::memcpy(&total_be, in + 9, sizeof total_be);
    out.total = ntohs(total_be);

    std::uint16_t len_be;
    std::memcpy(&len_be, in + 11, sizeof len_be);
    out.len = ntohs(len_be);

    return header_ok(out);
}

}  // namespace frag
