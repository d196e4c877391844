// -----------------------------------------------------------------------------
// uplink_packet.cpp: uplink frame codec.
//
// Byte layout and failure model: see include/lorabroker/uplink_packet.hpp.
// -----------------------------------------------------------------------------
#include "lorabroker/uplink_packet.hpp"

#include <sstream>

namespace lorabroker {

bool operator==(const UplinkPacket& a, const UplinkPacket& b) {
    return a.mhdr == b.mhdr
        && a.devaddr == b.devaddr
        && a.fcnt == b.fcnt
        && a.payload == b.payload
        && a.metadata == b.metadata
        && a.mic == b.mic;
}

bool is_uplink_mhdr(uint8_t mhdr) {
    return mhdr == MHDR_UNCONFIRMED_DATA_UP || mhdr == MHDR_CONFIRMED_DATA_UP;
}

// =============================================================================
// Encode
// =============================================================================

void encode_uplink(const UplinkPacket& pkt, std::vector<uint8_t>& out) {
    const size_t meta_len = pkt.metadata.encoded_size();

    out.clear();
    out.reserve(UPLINK_MIN_SIZE + pkt.payload.size() + meta_len);

    out.push_back(pkt.mhdr);
    out.insert(out.end(), pkt.devaddr.begin(), pkt.devaddr.end());

    out.push_back(static_cast<uint8_t>(pkt.fcnt & 0xFF));
    out.push_back(static_cast<uint8_t>((pkt.fcnt >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((pkt.fcnt >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((pkt.fcnt >> 24) & 0xFF));

    out.push_back(static_cast<uint8_t>(pkt.payload.size()));   // Payload caps at 255
    out.insert(out.end(), pkt.payload.begin(), pkt.payload.end());

    // Metadata capacity (16 x 34 bytes) always fits the u16 length.
    out.push_back(static_cast<uint8_t>(meta_len & 0xFF));
    out.push_back(static_cast<uint8_t>(meta_len >> 8));
    pkt.metadata.encode(out);

    out.insert(out.end(), pkt.mic.begin(), pkt.mic.end());
}

// =============================================================================
// Decode
// =============================================================================

Error decode_uplink(const uint8_t* data, size_t len, UplinkPacket& out) {
    if (!data || len < UPLINK_MIN_SIZE)
        return Error(ErrorKind::Structural, "frame shorter than minimum size");

    UplinkPacket pkt;
    size_t i = 0;

    // MHDR: type and major version in one byte
    pkt.mhdr = data[i++];
    if (!is_uplink_mhdr(pkt.mhdr))
        return Error(ErrorKind::Structural, "unrecognized frame type");

    for (auto& b : pkt.devaddr) b = data[i++];

    pkt.fcnt = static_cast<uint32_t>(data[i])
             | (static_cast<uint32_t>(data[i + 1]) << 8)
             | (static_cast<uint32_t>(data[i + 2]) << 16)
             | (static_cast<uint32_t>(data[i + 3]) << 24);
    i += 4;

    // Payload: fixed tail (meta len + MIC) must still fit after it
    const size_t n = data[i++];
    if (n + 2 + pkt.mic.size() > len - i)
        return Error(ErrorKind::Structural, "payload length exceeds frame");
    pkt.payload.assign(data + i, data + i + n);
    i += n;

    const size_t m = static_cast<size_t>(data[i]) | (static_cast<size_t>(data[i + 1]) << 8);
    i += 2;
    if (m + pkt.mic.size() != len - i)
        return Error(ErrorKind::Structural, "metadata length inconsistent with frame");

    Error err = Metadata::decode(data + i, m, pkt.metadata);
    if (err) return err;
    i += m;

    for (auto& b : pkt.mic) b = data[i++];

    out = pkt;
    return Error();
}

std::string to_pretty(const UplinkPacket& pkt) {
    std::ostringstream os;
    os << "type=" << (pkt.confirmed() ? "confirmed" : "unconfirmed")
       << " devaddr=" << to_hex(pkt.devaddr)
       << " fcnt=" << pkt.fcnt
       << " size=" << pkt.payload.size()
       << " mic=" << to_hex(pkt.mic);
    const std::string md = pkt.metadata.to_pretty();
    if (!md.empty()) os << ' ' << md;
    return os.str();
}

} // namespace lorabroker
