// -----------------------------------------------------------------------------
// disambiguator.cpp: MIC-based selection among DevAddr-colliding devices.
// Match policy table: include/lorabroker/disambiguator.hpp
// -----------------------------------------------------------------------------
#include "lorabroker/disambiguator.hpp"
#include "lorabroker/mic.hpp"

#include <openssl/crypto.h>

#include <string>

namespace lorabroker {

Error find_device(const UplinkPacket& pkt,
                  const std::vector<DeviceEntry>& candidates,
                  size_t& index) {
    return find_device(pkt, candidates, index, &compute_mic);
}

Error find_device(const UplinkPacket& pkt,
                  const std::vector<DeviceEntry>& candidates,
                  size_t& index,
                  MicFunction mic) {
    size_t matches = 0;
    size_t first   = 0;

    // Full scan, no early exit: a second match must be seen to be refused.
    for (size_t i = 0; i < candidates.size(); ++i) {
        Mic expected{};
        if (!mic(candidates[i].nwk_skey, pkt, expected))
            return Error(ErrorKind::Behavioural, "mic computation failed");

        if (CRYPTO_memcmp(expected.data(), pkt.mic.data(), expected.size()) != 0) continue;

        if (matches == 0) first = i;
        ++matches;
    }

    if (matches == 0)
        return Error(ErrorKind::Behavioural, "no device authenticates this frame");

    if (matches > 1) {
        throw InvariantViolation("mic matched " + std::to_string(matches)
                                 + " devices for devaddr " + to_hex(pkt.devaddr));
    }

    index = first;
    return Error();
}

} // namespace lorabroker
