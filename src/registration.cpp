#include "lorabroker/registration.hpp"

namespace lorabroker {

bool operator==(const DeviceEntry& a, const DeviceEntry& b) {
    return a.recipient == b.recipient && a.app_eui == b.app_eui
        && a.dev_eui == b.dev_eui && a.nwk_skey == b.nwk_skey;
}

bool operator==(const ApplicationEntry& a, const ApplicationEntry& b) {
    return a.recipient == b.recipient && a.app_eui == b.app_eui;
}

bool operator==(const DeviceRegistration& a, const DeviceRegistration& b) {
    return a.devaddr == b.devaddr && a.entry() == b.entry();
}

bool operator==(const ApplicationRegistration& a, const ApplicationRegistration& b) {
    return a.entry() == b.entry();
}

} // namespace lorabroker
