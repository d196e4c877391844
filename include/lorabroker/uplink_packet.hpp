/**
 * @page lb-uplink lorabroker Uplink Frame
 * @file uplink_packet.hpp
 * @brief Router -> broker uplink frame: structure, encoder, validating decoder.
 *
 * @details
 * An uplink arrives addressed only by a 4-byte `DevAddr`. Several devices may
 * share that address, so nothing in this frame is trusted until its MIC has
 * been matched against a registered session key (see disambiguator.hpp).
 *
 * ## Byte layout (little-endian integers)
 *
 * | Offset   | Size | Field                                                |
 * |----------|------|------------------------------------------------------|
 * | 0        | 1    | MHDR: 0x40 unconfirmed data up, 0x80 confirmed       |
 * | 1        | 4    | DevAddr                                              |
 * | 5        | 4    | FCnt                                                 |
 * | 9        | 1    | payload length N                                     |
 * | 10       | N    | payload (opaque, still encrypted for the app)        |
 * | 10+N     | 2    | metadata block length M                              |
 * | 12+N     | M    | metadata records (metadata.hpp)                      |
 * | 12+N+M   | 4    | MIC                                                  |
 *
 * The MHDR keeps the LoRaWAN bit split: MType in the top 3 bits, Major in
 * the low 2. Only data-up types with Major = 0 (LoRaWAN R1) are accepted.
 *
 * ## Failure model
 * `decode_uplink()` returns a Structural error, and leaves the output alone,
 * when the frame is shorter than `UPLINK_MIN_SIZE`, the MHDR is not
 * recognized, a length field runs past the end, bytes trail the MIC, or the
 * metadata block is malformed.
 *
 * `encode_uplink()` is total.
 */
#ifndef LORABROKER_UPLINK_PACKET_HPP
#define LORABROKER_UPLINK_PACKET_HPP

#include "etl/vector.h"
#include "errors.hpp"
#include "metadata.hpp"
#include "types.hpp"

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace lorabroker {

static constexpr size_t LB_PAYLOAD_MAX = 255;   ///< One-byte length prefix

using Payload = etl::vector<uint8_t, LB_PAYLOAD_MAX>;

enum : uint8_t {
    MHDR_UNCONFIRMED_DATA_UP = 0x40,
    MHDR_CONFIRMED_DATA_UP   = 0x80
};

/// MHDR + DevAddr + FCnt + N + M + MIC, with empty payload and metadata.
static constexpr size_t UPLINK_MIN_SIZE = 1 + 4 + 4 + 1 + 2 + 4;

/**
 * @struct UplinkPacket
 * @brief Decoded uplink, exactly as the router forwarded it.
 */
struct UplinkPacket {
    uint8_t  mhdr   = MHDR_UNCONFIRMED_DATA_UP;
    DevAddr  devaddr{};
    uint32_t fcnt   = 0;
    Payload  payload;
    Metadata metadata;
    Mic      mic{};

    bool confirmed() const { return mhdr == MHDR_CONFIRMED_DATA_UP; }
};

bool operator==(const UplinkPacket& a, const UplinkPacket& b);

/// @brief true for the MHDR values this broker accepts.
bool is_uplink_mhdr(uint8_t mhdr);

/// @brief Serialize `pkt` (including the MIC it carries) into `out`; `out` is cleared first.
void encode_uplink(const UplinkPacket& pkt, std::vector<uint8_t>& out);

/// @brief Parse and validate a raw frame. See the failure model above.
Error decode_uplink(const uint8_t* data, size_t len, UplinkPacket& out);

inline Error decode_uplink(const std::vector<uint8_t>& data, UplinkPacket& out) {
    return decode_uplink(data.data(), data.size(), out);
}

/// @brief `devaddr=.. fcnt=.. size=.. mic=..` followed by the metadata summary.
std::string to_pretty(const UplinkPacket& pkt);

} // namespace lorabroker

#endif // LORABROKER_UPLINK_PACKET_HPP
