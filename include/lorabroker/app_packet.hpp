/**
 * @file app_packet.hpp
 * @brief Application-addressed packet handed to handlers, and the uplink -> app translation.
 *
 * @details
 * Once a frame has been authenticated, its untrusted DevAddr is replaced by
 * the (AppEUI, DevEUI) pair of the device entry that produced the matching
 * MIC. Payload and metadata move across unchanged, byte for byte.
 *
 * ## Handler wire form (little-endian integers)
 * | Size | Field                  |
 * |------|------------------------|
 * | 1    | tag 0xA0               |
 * | 8    | AppEUI                 |
 * | 8    | DevEUI                 |
 * | 1    | payload length N       |
 * | N    | payload                |
 * | 2    | metadata length M      |
 * | M    | metadata records       |
 */
#ifndef LORABROKER_APP_PACKET_HPP
#define LORABROKER_APP_PACKET_HPP

#include "errors.hpp"
#include "metadata.hpp"
#include "registration.hpp"
#include "types.hpp"
#include "uplink_packet.hpp"

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace lorabroker {

static constexpr uint8_t APP_PACKET_TAG      = 0xA0;
static constexpr size_t  APP_PACKET_MIN_SIZE = 1 + 8 + 8 + 1 + 2;

struct AppPacket {
    EUI64    app_eui{};
    EUI64    dev_eui{};
    Payload  payload;
    Metadata metadata;
};

bool operator==(const AppPacket& a, const AppPacket& b);

/**
 * @brief Build the application packet for an authenticated uplink.
 *
 * Only call with the entry the MIC check selected: `entry` is what makes the
 * identity in the result trustworthy.
 */
AppPacket translate(const UplinkPacket& up, const DeviceEntry& entry);

/// @brief Serialize for the handler; `out` is cleared first.
void encode_app_packet(const AppPacket& pkt, std::vector<uint8_t>& out);

/// @brief Parse a handler frame; Structural on bad tag or inconsistent lengths.
Error decode_app_packet(const uint8_t* data, size_t len, AppPacket& out);

std::string to_pretty(const AppPacket& pkt);

} // namespace lorabroker

#endif // LORABROKER_APP_PACKET_HPP
