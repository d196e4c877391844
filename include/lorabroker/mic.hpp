/**
 * @file mic.hpp
 * @brief Uplink Message Integrity Code: AES-CMAC over the LoRaWAN B0 block and payload.
 *
 * @details
 * The MIC is the only thing that proves which device sent a frame. It is
 * computed with the device's network session key over:
 *
 * ```
 *  B0 (16 bytes)                                              payload
 *  +------+-------------+-----+---------+---------+----+---+ +--------+
 *  | 0x49 | 00 00 00 00 | dir | DevAddr | FCnt LE | 00 | N | |  N B   |
 *  +------+-------------+-----+---------+---------+----+---+ +--------+
 *     1          4         1       4         4       1   1
 * ```
 * with `dir = 0x00` for uplinks, and keeping the first 4 bytes of the CMAC.
 * This matches what a LoRaWAN 1.0 end device computes, so frames signed by a
 * real device and frames built by `sign_uplink()` verify the same way.
 *
 * AES-CMAC (RFC 4493) comes from OpenSSL's EVP_MAC interface. The functions
 * return false only when the crypto backend itself fails.
 */
#ifndef LORABROKER_MIC_HPP
#define LORABROKER_MIC_HPP

#include "types.hpp"
#include "uplink_packet.hpp"

#include <array>
#include <stdint.h>
#include <stddef.h>

namespace lorabroker {

/// @brief Full 16-byte AES-128-CMAC of `data`.
bool aes_cmac(const AES128Key& key, const uint8_t* data, size_t len,
              std::array<uint8_t, 16>& out);

/// @brief Recompute the MIC `pkt` should carry under `key` (ignores pkt.mic).
bool compute_mic(const AES128Key& key, const UplinkPacket& pkt, Mic& out);

/// @brief Set `pkt.mic` from `key`.
bool sign_uplink(const AES128Key& key, UplinkPacket& pkt);

} // namespace lorabroker

#endif // LORABROKER_MIC_HPP
