// -----------------------------------------------------------------------------
// broker.cpp: Register dispatch and the HandleUp pipeline.
// Stage table: include/lorabroker/broker.hpp
// -----------------------------------------------------------------------------
#include "lorabroker/broker.hpp"
#include "lorabroker/app_packet.hpp"
#include "lorabroker/disambiguator.hpp"
#include "lorabroker/uplink_packet.hpp"

#include <optional>
#include <string>
#include <variant>

namespace lorabroker {

Broker::Broker(Storage& storage, const Logger& log)
: storage_(storage), log_(log.with_tag("broker")) {}

Error Broker::fail(AckNacker& an, const Error& err) const {
    if (Error nerr = an.nack(err))
        log_.error("nack failed " + to_pretty(nerr));
    return err;
}

Error Broker::succeed(AckNacker& an) const {
    Error aerr = an.ack(std::nullopt);
    if (aerr) log_.error("ack failed " + to_pretty(aerr));
    return aerr;
}

// ---------------------- Register ----------------------

Error Broker::register_entry(const Registration& reg, AckNacker& an) const {
    if (const auto* dev = std::get_if<DeviceRegistration>(&reg)) {
        if (Error err = storage_.store_device(*dev)) {
            log_.warn("register device failed devaddr=" + to_hex(dev->devaddr) + " " + to_pretty(err));
            return fail(an, err);
        }
        log_.info("registered device devaddr=" + to_hex(dev->devaddr)
                  + " appeui=" + to_hex(dev->app_eui) + " deveui=" + to_hex(dev->dev_eui));
        return succeed(an);
    }

    if (const auto* app = std::get_if<ApplicationRegistration>(&reg)) {
        if (Error err = storage_.store_application(*app)) {
            log_.warn("register app failed appeui=" + to_hex(app->app_eui) + " " + to_pretty(err));
            return fail(an, err);
        }
        log_.info("registered app appeui=" + to_hex(app->app_eui));
        return succeed(an);
    }

    Error err(ErrorKind::Structural, "unsupported registration type");
    log_.warn("register rejected " + to_pretty(err));
    return fail(an, err);
}

// ---------------------- HandleUp ----------------------

Error Broker::handle_up(const uint8_t* data, size_t len, AckNacker& an, Adapter& adapter) const {
    // 1. decode
    UplinkPacket up;
    if (Error err = decode_uplink(data, len, up)) {
        log_.warn("uplink rejected len=" + std::to_string(len) + " " + to_pretty(err));
        return fail(an, err);
    }
    const std::string addr = to_hex(up.devaddr);
    log_.debug("uplink decoded devaddr=" + addr + " fcnt=" + std::to_string(up.fcnt));

    // 2. candidates
    std::vector<DeviceEntry> candidates;
    if (Error err = storage_.lookup_devices(up.devaddr, candidates)) {
        Error e(ErrorKind::Behavioural, err.reason);
        log_.warn("uplink rejected devaddr=" + addr + " " + to_pretty(e));
        return fail(an, e);
    }
    if (candidates.empty()) {
        Error e(ErrorKind::Behavioural, "no device registered for devaddr");
        log_.warn("uplink rejected devaddr=" + addr + " " + to_pretty(e));
        return fail(an, e);
    }
    log_.debug("candidates devaddr=" + addr + " n=" + std::to_string(candidates.size()));

    // 3. authenticate
    size_t index = 0;
    try {
        if (Error err = find_device(up, candidates, index)) {
            Error e(ErrorKind::Behavioural, err.reason);
            log_.warn("uplink rejected devaddr=" + addr + " " + to_pretty(e));
            return fail(an, e);
        }
    } catch (const InvariantViolation& ex) {
        log_.error(std::string("invariant violated: ") + ex.what());
        throw;
    }
    const DeviceEntry& dev = candidates[index];

    // 4. translate
    AppPacket app = translate(up, dev);
    const std::string who = "devaddr=" + addr + " appeui=" + to_hex(dev.app_eui)
                          + " deveui=" + to_hex(dev.dev_eui);
    log_.debug("authenticated " + who);

    // 5. resolve
    RecipientPtr recipient;
    if (Error err = adapter.resolve_recipient(dev.recipient, recipient)) {
        log_.warn("resolve failed " + who + " " + to_pretty(err));
        return fail(an, err);
    }

    // 6. send
    if (Error err = adapter.send(app, std::vector<RecipientPtr>{recipient})) {
        log_.warn("send failed " + who + " to=" + (recipient ? recipient->describe() : std::string("?"))
                  + " " + to_pretty(err));
        return fail(an, err);
    }
    log_.info("forwarded " + who + " to=" + (recipient ? recipient->describe() : std::string("?")));

    // 7. ack
    return succeed(an);
}

} // namespace lorabroker
