// -----------------------------------------------------------------------------
// mic.cpp: AES-CMAC and uplink MIC computation (OpenSSL EVP_MAC).
// -----------------------------------------------------------------------------
#include "lorabroker/mic.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <memory>
#include <vector>

namespace lorabroker {

namespace {

struct MacDeleter {
    void operator()(EVP_MAC* m) const { EVP_MAC_free(m); }
};
struct MacCtxDeleter {
    void operator()(EVP_MAC_CTX* c) const { EVP_MAC_CTX_free(c); }
};

using MacPtr    = std::unique_ptr<EVP_MAC, MacDeleter>;
using MacCtxPtr = std::unique_ptr<EVP_MAC_CTX, MacCtxDeleter>;

constexpr uint8_t B0_TAG    = 0x49;
constexpr uint8_t DIR_UP    = 0x00;
constexpr size_t  B0_SIZE   = 16;

} // namespace

bool aes_cmac(const AES128Key& key, const uint8_t* data, size_t len,
              std::array<uint8_t, 16>& out) {
    MacPtr mac(EVP_MAC_fetch(nullptr, "CMAC", nullptr));
    if (!mac) return false;

    MacCtxPtr ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) return false;

    char cipher[] = "AES-128-CBC";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_CIPHER, cipher, 0),
        OSSL_PARAM_construct_end()
    };

    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1) return false;
    if (len > 0 && EVP_MAC_update(ctx.get(), data, len) != 1)        return false;

    size_t written = 0;
    if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1) return false;
    return written == out.size();
}

bool compute_mic(const AES128Key& key, const UplinkPacket& pkt, Mic& out) {
    std::vector<uint8_t> msg;
    msg.reserve(B0_SIZE + pkt.payload.size());

    // B0 authentication block
    msg.push_back(B0_TAG);
    msg.insert(msg.end(), 4, 0x00);
    msg.push_back(DIR_UP);
    msg.insert(msg.end(), pkt.devaddr.begin(), pkt.devaddr.end());
    msg.push_back(static_cast<uint8_t>(pkt.fcnt & 0xFF));
    msg.push_back(static_cast<uint8_t>((pkt.fcnt >> 8) & 0xFF));
    msg.push_back(static_cast<uint8_t>((pkt.fcnt >> 16) & 0xFF));
    msg.push_back(static_cast<uint8_t>((pkt.fcnt >> 24) & 0xFF));
    msg.push_back(0x00);
    msg.push_back(static_cast<uint8_t>(pkt.payload.size()));

    msg.insert(msg.end(), pkt.payload.begin(), pkt.payload.end());

    std::array<uint8_t, 16> full{};
    if (!aes_cmac(key, msg.data(), msg.size(), full)) return false;
    for (size_t i = 0; i < out.size(); ++i) out[i] = full[i];
    return true;
}

bool sign_uplink(const AES128Key& key, UplinkPacket& pkt) {
    Mic m{};
    if (!compute_mic(key, pkt, m)) return false;
    pkt.mic = m;
    return true;
}

} // namespace lorabroker
