/**
 * @page lb-metadata lorabroker Metadata
 * @file metadata.hpp
 * @brief Gateway metadata block: ordered TLV records with typed accessors, heap-free.
 *
 * @details
 * Every uplink carries what the receiving gateway observed: signal strength,
 * SNR, frequency, data rate, timestamps. The broker never interprets those
 * values; it only has to hand them to the application handler **unchanged**.
 * So the container keeps the records exactly as they arrived, in wire order,
 * unknown tags included, and offers typed accessors on top.
 *
 * ## Wire form
 * A sequence of records, no count and no terminator (the enclosing frame
 * carries the block length):
 *
 * | Bytes | Field                      |
 * |-------|----------------------------|
 * | 1     | tag                        |
 * | 1     | len                        |
 * | len   | value (little-endian ints) |
 *
 * ## Known tags
 * | Tag  | Name        | Type | Notes                                  |
 * |------|-------------|------|----------------------------------------|
 * | 0x01 | chan        | u8   | IF channel                             |
 * | 0x02 | rfch        | u8   | RF chain                               |
 * | 0x03 | freq_hz     | u32  | centre frequency                       |
 * | 0x04 | stat        | i8   | CRC status (1 ok, -1 fail, 0 none)     |
 * | 0x05 | modu        | str  | "LORA" / "FSK"                         |
 * | 0x06 | datr        | str  | "SF7BW125"                             |
 * | 0x07 | codr        | str  | "4/5"                                  |
 * | 0x08 | rssi_dbm    | i16  |                                        |
 * | 0x09 | lsnr_c10    | i16  | SNR in 0.1 dB (55 -> 5.5 dB)           |
 * | 0x0A | tmst        | u32  | gateway concentrator counter (us)      |
 * | 0x0B | time        | str  | RFC3339 UTC receive time               |
 * | 0x0C | size        | u16  | PHY payload size                       |
 * | 0x0D | gateway_eui | 8B   |                                        |
 *
 * ## Capacities
 * - `LB_META_FIELDS_MAX` records (16), each value up to `LB_META_VAL_MAX` bytes (32).
 * - Decoding a block that exceeds either is a Structural error; the broker
 *   does not truncate metadata.
 *
 * @code
 * lorabroker::Metadata md;
 * md.set_rssi_dbm(-92);
 * md.set_lsnr_c10(55);
 * md.set_datr("SF7BW125");
 * std::string line = md.to_pretty();   // "datr=SF7BW125 lsnr_db=5.5 rssi_dbm=-92" (wire order)
 * @endcode
 */
#ifndef LORABROKER_METADATA_HPP
#define LORABROKER_METADATA_HPP

#include "etl/vector.h"
#include "errors.hpp"
#include "types.hpp"

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace lorabroker {

static constexpr size_t LB_META_FIELDS_MAX = 16;   ///< Max records per block
static constexpr size_t LB_META_VAL_MAX    = 32;   ///< Max value bytes per record

using MetaValue = etl::vector<uint8_t, LB_META_VAL_MAX>;

enum : uint8_t {
    META_CHAN        = 0x01,
    META_RFCH        = 0x02,
    META_FREQ_HZ     = 0x03,
    META_STAT        = 0x04,
    META_MODU        = 0x05,
    META_DATR        = 0x06,
    META_CODR        = 0x07,
    META_RSSI_DBM    = 0x08,
    META_LSNR_C10    = 0x09,
    META_TMST        = 0x0A,
    META_TIME        = 0x0B,
    META_SIZE        = 0x0C,
    META_GATEWAY_EUI = 0x0D
};

/// @brief One TLV record as it appeared on the wire.
struct MetaField {
    uint8_t   tag = 0;
    MetaValue val;
};

bool operator==(const MetaField& a, const MetaField& b);
bool operator!=(const MetaField& a, const MetaField& b);

/**
 * @brief Ordered, fixed-capacity list of metadata records.
 *
 * Setters replace the first record with the same tag, or append. They
 * return false when the block is full or the value does not fit.
 * Getters return false when the tag is absent or its length does not match
 * the type.
 */
struct Metadata {
    etl::vector<MetaField, LB_META_FIELDS_MAX> fields;

    /// @name Raw record access
    ///@{
    bool set_raw(uint8_t tag, const uint8_t* p, size_t n);
    const MetaValue* get_raw(uint8_t tag) const;
    bool has(uint8_t tag) const { return get_raw(tag) != nullptr; }
    bool remove(uint8_t tag);
    size_t size() const { return fields.size(); }
    bool empty() const { return fields.empty(); }
    ///@}

    /// @name Typed accessors
    ///@{
    bool set_chan(uint8_t v);
    bool chan(uint8_t& out) const;
    bool set_rfch(uint8_t v);
    bool rfch(uint8_t& out) const;
    bool set_freq_hz(uint32_t v);
    bool freq_hz(uint32_t& out) const;
    bool set_stat(int8_t v);
    bool stat(int8_t& out) const;
    bool set_modu(const std::string& v);
    bool modu(std::string& out) const;
    bool set_datr(const std::string& v);
    bool datr(std::string& out) const;
    bool set_codr(const std::string& v);
    bool codr(std::string& out) const;
    bool set_rssi_dbm(int16_t v);
    bool rssi_dbm(int16_t& out) const;
    bool set_lsnr_c10(int16_t v);
    bool lsnr_c10(int16_t& out) const;
    bool set_tmst(uint32_t v);
    bool tmst(uint32_t& out) const;
    bool set_time(const std::string& v);
    bool time(std::string& out) const;
    bool set_size(uint16_t v);
    bool size_bytes(uint16_t& out) const;
    bool set_gateway_eui(const EUI64& v);
    bool gateway_eui(EUI64& out) const;
    ///@}

    /// @brief Number of bytes encode() appends.
    size_t encoded_size() const;

    /// @brief Append every record (tag, len, value) to `out` in stored order.
    void encode(std::vector<uint8_t>& out) const;

    /**
     * @brief Parse a metadata block of exactly `n` bytes.
     * @return Structural error on a truncated record, a value longer than
     *         `LB_META_VAL_MAX`, or more than `LB_META_FIELDS_MAX` records.
     *         `out` is only written on success.
     */
    static Error decode(const uint8_t* p, size_t n, Metadata& out);

    /// @brief One-line `key=value` summary in stored order; unknown tags and unprintable strings as `tagN=0x..`.
    std::string to_pretty() const;
};

bool operator==(const Metadata& a, const Metadata& b);
bool operator!=(const Metadata& a, const Metadata& b);

} // namespace lorabroker

#endif // LORABROKER_METADATA_HPP
