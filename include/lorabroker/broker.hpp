/**
 * @file broker.hpp
 * @brief The broker core: registration intake and the uplink pipeline.
 *
 * @details
 * The broker owns no mutable state of its own. Everything it remembers lives
 * behind the Storage it was built with, everything it delivers goes through
 * the Adapter handed to each call, and every call ends with exactly one
 * ack() or nack() on the AckNacker handed to it.
 *
 * ## Register
 * | Registration              | Action              | Outcome on failure       |
 * |---------------------------|---------------------|--------------------------|
 * | DeviceRegistration        | store_device()      | store's error, unchanged |
 * | ApplicationRegistration   | store_application() | store's error, unchanged |
 * | anything else             | nothing stored      | Structural               |
 *
 * ## HandleUp
 * Stages run in this order and stop at the first failure:
 *
 * | # | Stage                  | Failure kind            |
 * |---|------------------------|-------------------------|
 * | 1 | decode_uplink          | Structural              |
 * | 2 | Storage lookup         | Behavioural             |
 * | 3 | find_device (MIC)      | Behavioural             |
 * | 4 | translate              | (cannot fail)           |
 * | 5 | resolve_recipient      | adapter's kind          |
 * | 6 | send                   | adapter's kind          |
 * | 7 | ack()                  |                         |
 *
 * Return value: the failing stage's Error, or the result of ack() on success.
 *
 * If the MIC matches more than one candidate, InvariantViolation is logged
 * and rethrown; neither ack() nor nack() is called for that frame.
 *
 * Thread-safety: const member functions only; safe to call concurrently when
 * the Storage is.
 */
#ifndef LORABROKER_BROKER_HPP
#define LORABROKER_BROKER_HPP

#include "errors.hpp"
#include "interfaces.hpp"
#include "log.hpp"
#include "registration.hpp"

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace lorabroker {

class Broker {
public:
  Broker(Storage& storage, const Logger& log);

  Error register_entry(const Registration& reg, AckNacker& an) const;

  Error handle_up(const uint8_t* data, size_t len, AckNacker& an, Adapter& adapter) const;
  Error handle_up(const std::vector<uint8_t>& frame, AckNacker& an, Adapter& adapter) const {
    return handle_up(frame.data(), frame.size(), an, adapter);
  }

private:
  /// Report `err` through nack(); returns `err` so callers can `return fail(...)`.
  Error fail(AckNacker& an, const Error& err) const;
  Error succeed(AckNacker& an) const;

  Storage& storage_;
  Logger   log_;
};

} // namespace lorabroker

#endif // LORABROKER_BROKER_HPP
