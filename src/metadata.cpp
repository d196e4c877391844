// ============================================================================
// metadata.cpp: implementation for metadata.hpp
// Record layout and tag table live in the header.
// ============================================================================
#include "lorabroker/metadata.hpp"

#include <algorithm>
#include <sstream>

namespace lorabroker {

// ----------------------------------------------------------------------------
// Value packers. Integers are little-endian, strings are raw bytes.
// ----------------------------------------------------------------------------

static inline bool as_u8(const MetaValue* v, uint8_t& out) {
    if (!v || v->size() != 1) return false;
    out = (*v)[0];
    return true;
}

static inline bool as_u16(const MetaValue* v, uint16_t& out) {
    if (!v || v->size() != 2) return false;
    out = static_cast<uint16_t>((*v)[0] | ((*v)[1] << 8));
    return true;
}

static inline bool as_u32(const MetaValue* v, uint32_t& out) {
    if (!v || v->size() != 4) return false;
    out = static_cast<uint32_t>((*v)[0])
        | (static_cast<uint32_t>((*v)[1]) << 8)
        | (static_cast<uint32_t>((*v)[2]) << 16)
        | (static_cast<uint32_t>((*v)[3]) << 24);
    return true;
}

static inline bool as_str(const MetaValue* v, std::string& out) {
    if (!v) return false;
    out.assign(v->begin(), v->end());
    return true;
}

static inline bool put_u8(Metadata& m, uint8_t tag, uint8_t v) {
    return m.set_raw(tag, &v, 1);
}

static inline bool put_u16(Metadata& m, uint8_t tag, uint16_t v) {
    uint8_t x[2] = { static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>(v >> 8) };
    return m.set_raw(tag, x, 2);
}

static inline bool put_u32(Metadata& m, uint8_t tag, uint32_t v) {
    uint8_t x[4] = { static_cast<uint8_t>(v & 0xFF),
                     static_cast<uint8_t>((v >> 8) & 0xFF),
                     static_cast<uint8_t>((v >> 16) & 0xFF),
                     static_cast<uint8_t>((v >> 24) & 0xFF) };
    return m.set_raw(tag, x, 4);
}

static inline bool put_str(Metadata& m, uint8_t tag, const std::string& s) {
    return m.set_raw(tag, reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// ----------------------------------------------------------------------------
// Records
// ----------------------------------------------------------------------------

bool operator==(const MetaField& a, const MetaField& b) {
    return a.tag == b.tag && a.val == b.val;
}

bool operator!=(const MetaField& a, const MetaField& b) { return !(a == b); }

bool Metadata::set_raw(uint8_t tag, const uint8_t* p, size_t n) {
    if (n > LB_META_VAL_MAX) return false;
    for (auto& f : fields) {
        if (f.tag == tag) {                       // replace in place, keep position
            f.val.assign(p, p + n);
            return true;
        }
    }
    if (fields.full()) return false;
    MetaField f;
    f.tag = tag;
    f.val.assign(p, p + n);
    fields.push_back(f);
    return true;
}

const MetaValue* Metadata::get_raw(uint8_t tag) const {
    for (const auto& f : fields) if (f.tag == tag) return &f.val;
    return nullptr;
}

bool Metadata::remove(uint8_t tag) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].tag == tag) {
            fields.erase(fields.begin() + i);
            return true;
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// Typed accessors
// ----------------------------------------------------------------------------

bool Metadata::set_chan(uint8_t v)           { return put_u8(*this, META_CHAN, v); }
bool Metadata::chan(uint8_t& out) const      { return as_u8(get_raw(META_CHAN), out); }

bool Metadata::set_rfch(uint8_t v)           { return put_u8(*this, META_RFCH, v); }
bool Metadata::rfch(uint8_t& out) const      { return as_u8(get_raw(META_RFCH), out); }

bool Metadata::set_freq_hz(uint32_t v)       { return put_u32(*this, META_FREQ_HZ, v); }
bool Metadata::freq_hz(uint32_t& out) const  { return as_u32(get_raw(META_FREQ_HZ), out); }

bool Metadata::set_stat(int8_t v)            { return put_u8(*this, META_STAT, static_cast<uint8_t>(v)); }
bool Metadata::stat(int8_t& out) const {
    uint8_t raw = 0;
    if (!as_u8(get_raw(META_STAT), raw)) return false;
    out = static_cast<int8_t>(raw);
    return true;
}

bool Metadata::set_modu(const std::string& v) { return put_str(*this, META_MODU, v); }
bool Metadata::modu(std::string& out) const   { return as_str(get_raw(META_MODU), out); }

bool Metadata::set_datr(const std::string& v) { return put_str(*this, META_DATR, v); }
bool Metadata::datr(std::string& out) const   { return as_str(get_raw(META_DATR), out); }

bool Metadata::set_codr(const std::string& v) { return put_str(*this, META_CODR, v); }
bool Metadata::codr(std::string& out) const   { return as_str(get_raw(META_CODR), out); }

bool Metadata::set_rssi_dbm(int16_t v) { return put_u16(*this, META_RSSI_DBM, static_cast<uint16_t>(v)); }
bool Metadata::rssi_dbm(int16_t& out) const {
    uint16_t raw = 0;
    if (!as_u16(get_raw(META_RSSI_DBM), raw)) return false;
    out = static_cast<int16_t>(raw);
    return true;
}

bool Metadata::set_lsnr_c10(int16_t v) { return put_u16(*this, META_LSNR_C10, static_cast<uint16_t>(v)); }
bool Metadata::lsnr_c10(int16_t& out) const {
    uint16_t raw = 0;
    if (!as_u16(get_raw(META_LSNR_C10), raw)) return false;
    out = static_cast<int16_t>(raw);
    return true;
}

bool Metadata::set_tmst(uint32_t v)          { return put_u32(*this, META_TMST, v); }
bool Metadata::tmst(uint32_t& out) const     { return as_u32(get_raw(META_TMST), out); }

bool Metadata::set_time(const std::string& v) { return put_str(*this, META_TIME, v); }
bool Metadata::time(std::string& out) const   { return as_str(get_raw(META_TIME), out); }

bool Metadata::set_size(uint16_t v)          { return put_u16(*this, META_SIZE, v); }
bool Metadata::size_bytes(uint16_t& out) const { return as_u16(get_raw(META_SIZE), out); }

bool Metadata::set_gateway_eui(const EUI64& v) { return set_raw(META_GATEWAY_EUI, v.data(), v.size()); }
bool Metadata::gateway_eui(EUI64& out) const {
    const MetaValue* v = get_raw(META_GATEWAY_EUI);
    if (!v || v->size() != out.size()) return false;
    std::copy(v->begin(), v->end(), out.begin());
    return true;
}

// ----------------------------------------------------------------------------
// Wire form
// ----------------------------------------------------------------------------

size_t Metadata::encoded_size() const {
    size_t n = 0;
    for (const auto& f : fields) n += 2 + f.val.size();
    return n;
}

void Metadata::encode(std::vector<uint8_t>& out) const {
    out.reserve(out.size() + encoded_size());
    for (const auto& f : fields) {
        out.push_back(f.tag);
        out.push_back(static_cast<uint8_t>(f.val.size()));
        out.insert(out.end(), f.val.begin(), f.val.end());
    }
}

Error Metadata::decode(const uint8_t* p, size_t n, Metadata& out) {
    Metadata tmp;
    size_t i = 0;
    while (i < n) {
        if (n - i < 2)
            return Error(ErrorKind::Structural, "metadata record header truncated");
        const uint8_t tag = p[i];
        const uint8_t len = p[i + 1];
        i += 2;
        if (len > n - i)
            return Error(ErrorKind::Structural, "metadata record overruns block");
        if (len > LB_META_VAL_MAX)
            return Error(ErrorKind::Structural, "metadata value too long");
        if (tmp.fields.full())
            return Error(ErrorKind::Structural, "too many metadata records");

        // Append as-is: duplicate and unknown tags survive untouched.
        MetaField f;
        f.tag = tag;
        f.val.assign(p + i, p + i + len);
        tmp.fields.push_back(f);
        i += len;
    }
    out = tmp;
    return Error();
}

// Visible ASCII only, no space: the value must stay one key=value token.
static bool printable(const MetaValue* v) {
    for (uint8_t c : *v) {
        if (c <= 0x20 || c >= 0x7F) return false;
    }
    return true;
}

std::string Metadata::to_pretty() const {
    std::ostringstream os;
    bool first = true;
    auto sep = [&]() -> std::ostream& {
        if (!first) os << ' ';
        first = false;
        return os;
    };

    for (const auto& f : fields) {
        const MetaValue* v = &f.val;
        switch (f.tag) {
            case META_CHAN: { uint8_t x;  if (as_u8(v, x))  { sep() << "chan=" << unsigned(x); continue; } break; }
            case META_RFCH: { uint8_t x;  if (as_u8(v, x))  { sep() << "rfch=" << unsigned(x); continue; } break; }
            case META_FREQ_HZ: { uint32_t x; if (as_u32(v, x)) { sep() << "freq_hz=" << x; continue; } break; }
            case META_STAT: { uint8_t x;  if (as_u8(v, x))  { sep() << "stat=" << int(static_cast<int8_t>(x)); continue; } break; }
            case META_MODU: { if (printable(v)) { sep() << "modu=" << std::string(v->begin(), v->end()); continue; } break; }
            case META_DATR: { if (printable(v)) { sep() << "datr=" << std::string(v->begin(), v->end()); continue; } break; }
            case META_CODR: { if (printable(v)) { sep() << "codr=" << std::string(v->begin(), v->end()); continue; } break; }
            case META_TIME: { if (printable(v)) { sep() << "time=" << std::string(v->begin(), v->end()); continue; } break; }
            case META_RSSI_DBM: {
                uint16_t x;
                if (as_u16(v, x)) { sep() << "rssi_dbm=" << static_cast<int16_t>(x); continue; }
                break;
            }
            case META_LSNR_C10: {
                uint16_t x;
                if (as_u16(v, x)) { sep() << "lsnr_db=" << (static_cast<int16_t>(x) / 10.0); continue; }
                break;
            }
            case META_TMST: { uint32_t x; if (as_u32(v, x)) { sep() << "tmst=" << x; continue; } break; }
            case META_SIZE: { uint16_t x; if (as_u16(v, x)) { sep() << "size=" << x; continue; } break; }
            case META_GATEWAY_EUI:
                if (v->size() == 8) { sep() << "gw=" << bytes_to_hex(v->data(), v->size()); continue; }
                break;
            default:
                break;
        }
        // Unknown tag, a known tag with an unexpected length or an unprintable string: dump raw.
        sep() << "tag" << unsigned(f.tag) << "=0x" << bytes_to_hex(v->data(), v->size());
    }
    return os.str();
}

bool operator==(const Metadata& a, const Metadata& b) {
    if (a.fields.size() != b.fields.size()) return false;
    for (size_t i = 0; i < a.fields.size(); ++i)
        if (a.fields[i] != b.fields[i]) return false;
    return true;
}

bool operator!=(const Metadata& a, const Metadata& b) { return !(a == b); }

} // namespace lorabroker
