/**
 * @file registration.hpp
 * @brief Registry records and the closed set of registration requests.
 *
 * @details
 * - `DeviceEntry` / `ApplicationEntry` are what a Storage hands back. The
 *   broker treats them as read-only snapshots.
 * - A `Registration` is a transient request. Only two shapes are accepted:
 *
 * | Alternative               | Broker action            |
 * |---------------------------|--------------------------|
 * | `DeviceRegistration`      | Storage::store_device    |
 * | `ApplicationRegistration` | Storage::store_application |
 * | `RouterRegistration`      | rejected, Structural     |
 * | `std::monostate`          | rejected, Structural     |
 *
 * `RouterRegistration` exists because routers announce themselves with the
 * same request channel; the broker is the wrong recipient for it.
 */
#ifndef LORABROKER_REGISTRATION_HPP
#define LORABROKER_REGISTRATION_HPP

#include "types.hpp"

#include <variant>

namespace lorabroker {

/// @brief One device as known to the registry.
struct DeviceEntry {
    RawRecipient recipient;   ///< Handler descriptor, resolved by the Adapter
    EUI64        app_eui{};
    EUI64        dev_eui{};
    AES128Key    nwk_skey{};
};

bool operator==(const DeviceEntry& a, const DeviceEntry& b);

/// @brief One application (handler) as known to the registry.
struct ApplicationEntry {
    RawRecipient recipient;
    EUI64        app_eui{};
};

bool operator==(const ApplicationEntry& a, const ApplicationEntry& b);

struct DeviceRegistration {
    RawRecipient recipient;
    DevAddr      devaddr{};
    EUI64        app_eui{};
    EUI64        dev_eui{};
    AES128Key    nwk_skey{};

    DeviceEntry entry() const { return DeviceEntry{recipient, app_eui, dev_eui, nwk_skey}; }
};

bool operator==(const DeviceRegistration& a, const DeviceRegistration& b);

struct ApplicationRegistration {
    RawRecipient recipient;
    EUI64        app_eui{};

    ApplicationEntry entry() const { return ApplicationEntry{recipient, app_eui}; }
};

bool operator==(const ApplicationRegistration& a, const ApplicationRegistration& b);

struct RouterRegistration {
    RawRecipient recipient;
    DevAddr      devaddr{};
};

using Registration = std::variant<std::monostate,
                                  DeviceRegistration,
                                  ApplicationRegistration,
                                  RouterRegistration>;

} // namespace lorabroker

#endif // LORABROKER_REGISTRATION_HPP
