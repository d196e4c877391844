/**
 * @page lb-types lorabroker identifiers
 * @file types.hpp
 * @brief Fixed-size identifiers and keys carried through the broker, plus hex helpers.
 *
 * @details
 * | Type        | Bytes | Unique?  | Role                                              |
 * |-------------|-------|----------|---------------------------------------------------|
 * | `DevAddr`   | 4     | no       | registry lookup key only, never proof of identity |
 * | `EUI64`     | 8     | yes      | AppEUI / DevEUI, the real identity of a device    |
 * | `AES128Key` | 16    | secret   | network session key bound to one device entry     |
 * | `Mic`       | 4     | n/a      | trailing integrity tag of an uplink frame         |
 *
 * All of them are plain `std::array<uint8_t, N>`: comparable, usable as map
 * keys, copyable without heap traffic.
 *
 * Hex form is big-nibble-first, uppercase, no separators. Parsing accepts an
 * optional "0x" prefix and either case:
 *
 * @code
 * lorabroker::EUI64 app{};
 * if (!lorabroker::from_hex("0x0102030405060708", app)) { ... }
 * std::string s = lorabroker::to_hex(app);   // "0102030405060708"
 * @endcode
 */
#ifndef LORABROKER_TYPES_HPP
#define LORABROKER_TYPES_HPP

#include <stdint.h>
#include <stddef.h>
#include <array>
#include <string>
#include <vector>

namespace lorabroker {

using DevAddr   = std::array<uint8_t, 4>;
using EUI64     = std::array<uint8_t, 8>;
using AES128Key = std::array<uint8_t, 16>;
using Mic       = std::array<uint8_t, 4>;

/// Opaque recipient descriptor, interpreted only by an Adapter.
using RawRecipient = std::vector<uint8_t>;

/// @brief Render `n` bytes as uppercase hex.
std::string bytes_to_hex(const uint8_t* p, size_t n);

/**
 * @brief Parse a hex string of any even length into bytes.
 * @return false on an odd length or a non-hex character; `out` is left untouched.
 */
bool hex_to_bytes(const std::string& hex, std::vector<uint8_t>& out);

template <size_t N>
std::string to_hex(const std::array<uint8_t, N>& a) {
    return bytes_to_hex(a.data(), N);
}

/// @brief Parse exactly `2*N` hex digits into a fixed array.
template <size_t N>
bool from_hex(const std::string& hex, std::array<uint8_t, N>& out) {
    std::vector<uint8_t> tmp;
    if (!hex_to_bytes(hex, tmp) || tmp.size() != N) return false;
    for (size_t i = 0; i < N; ++i) out[i] = tmp[i];
    return true;
}

} // namespace lorabroker

#endif // LORABROKER_TYPES_HPP
