// -----------------------------------------------------------------------------
// app_packet.cpp: translation and handler-side codec.
// -----------------------------------------------------------------------------
#include "lorabroker/app_packet.hpp"

#include <sstream>

namespace lorabroker {

bool operator==(const AppPacket& a, const AppPacket& b) {
    return a.app_eui == b.app_eui
        && a.dev_eui == b.dev_eui
        && a.payload == b.payload
        && a.metadata == b.metadata;
}

AppPacket translate(const UplinkPacket& up, const DeviceEntry& entry) {
    AppPacket out;
    out.app_eui  = entry.app_eui;
    out.dev_eui  = entry.dev_eui;
    out.payload  = up.payload;        // verbatim
    out.metadata = up.metadata;       // verbatim, record order included
    return out;
}

void encode_app_packet(const AppPacket& pkt, std::vector<uint8_t>& out) {
    const size_t meta_len = pkt.metadata.encoded_size();

    out.clear();
    out.reserve(APP_PACKET_MIN_SIZE + pkt.payload.size() + meta_len);

    out.push_back(APP_PACKET_TAG);
    out.insert(out.end(), pkt.app_eui.begin(), pkt.app_eui.end());
    out.insert(out.end(), pkt.dev_eui.begin(), pkt.dev_eui.end());

    out.push_back(static_cast<uint8_t>(pkt.payload.size()));
    out.insert(out.end(), pkt.payload.begin(), pkt.payload.end());

    out.push_back(static_cast<uint8_t>(meta_len & 0xFF));
    out.push_back(static_cast<uint8_t>(meta_len >> 8));
    pkt.metadata.encode(out);
}

Error decode_app_packet(const uint8_t* data, size_t len, AppPacket& out) {
    if (!data || len < APP_PACKET_MIN_SIZE)
        return Error(ErrorKind::Structural, "app packet shorter than minimum size");
    if (data[0] != APP_PACKET_TAG)
        return Error(ErrorKind::Structural, "unrecognized app packet tag");

    AppPacket pkt;
    size_t i = 1;
    for (auto& b : pkt.app_eui) b = data[i++];
    for (auto& b : pkt.dev_eui) b = data[i++];

    const size_t n = data[i++];
    if (n + 2 > len - i)
        return Error(ErrorKind::Structural, "payload length exceeds app packet");
    pkt.payload.assign(data + i, data + i + n);
    i += n;

    const size_t m = static_cast<size_t>(data[i]) | (static_cast<size_t>(data[i + 1]) << 8);
    i += 2;
    if (m != len - i)
        return Error(ErrorKind::Structural, "metadata length inconsistent with app packet");

    Error err = Metadata::decode(data + i, m, pkt.metadata);
    if (err) return err;

    out = pkt;
    return Error();
}

std::string to_pretty(const AppPacket& pkt) {
    std::ostringstream os;
    os << "appeui=" << to_hex(pkt.app_eui)
       << " deveui=" << to_hex(pkt.dev_eui)
       << " size=" << pkt.payload.size()
       << " payload=" << bytes_to_hex(pkt.payload.data(), pkt.payload.size());
    const std::string md = pkt.metadata.to_pretty();
    if (!md.empty()) os << ' ' << md;
    return os.str();
}

} // namespace lorabroker
