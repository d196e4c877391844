/**
 * @file disambiguator.hpp
 * @brief Pick the one registered device whose session key reproduces an uplink's MIC.
 *
 * @details
 * DevAddr is short and reused; the registry can return several entries for
 * it. The MIC is the authentication boundary: candidates are tried in the
 * order the registry returned them, each one's MIC is recomputed, and the
 * result is compared byte for byte with the MIC the frame carries.
 *
 * | Matches | Result                                                       |
 * |---------|--------------------------------------------------------------|
 * | 0       | Behavioural error, same as an unknown address                |
 * | 1       | `index` of that candidate                                    |
 * | > 1     | throws InvariantViolation, never resolved by picking one     |
 *
 * A crypto backend failure is also a Behavioural error: the frame could not be
 * authenticated. The reason text names the backend failure.
 *
 * Until this returns successfully, no candidate's AppEUI/DevEUI is trusted
 * and none should appear in logs.
 */
#ifndef LORABROKER_DISAMBIGUATOR_HPP
#define LORABROKER_DISAMBIGUATOR_HPP

#include "errors.hpp"
#include "registration.hpp"
#include "uplink_packet.hpp"

#include <stddef.h>
#include <vector>

namespace lorabroker {

/// @brief Signature of the MIC computation used per candidate (compute_mic by default).
using MicFunction = bool (*)(const AES128Key& key, const UplinkPacket& pkt, Mic& out);

Error find_device(const UplinkPacket& pkt,
                  const std::vector<DeviceEntry>& candidates,
                  size_t& index);

Error find_device(const UplinkPacket& pkt,
                  const std::vector<DeviceEntry>& candidates,
                  size_t& index,
                  MicFunction mic);

} // namespace lorabroker

#endif // LORABROKER_DISAMBIGUATOR_HPP
