#pragma once
/**
 * @file interfaces.hpp
 * @brief Collaborator contracts the broker is wired against.
 *
 * Contracts:
 *  - AckNacker: exactly one of ack()/nack() per broker call.
 *  - Adapter:   resolve_recipient() turns an opaque descriptor into a
 *               deliverable Recipient; send() delivers one packet to a list.
 *  - Storage:   lookup_devices() returns every entry sharing a DevAddr;
 *               store_*() persist registrations.
 *
 * Every call returns an Error; a default-constructed one means success.
 * Implementations own their own locking, the broker holds no shared state.
 */

#include "app_packet.hpp"
#include "errors.hpp"
#include "registration.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lorabroker {

class AckNacker {
public:
  virtual ~AckNacker() = default;
  /// Positive outcome; `response` is an optional payload for the caller (unused by uplinks today).
  virtual Error ack(const std::optional<std::vector<uint8_t>>& response) = 0;
  /// Negative outcome carrying the classified reason.
  virtual Error nack(const Error& reason) = 0;
};

/// A resolved, deliverable target. Concrete shape belongs to the Adapter.
class Recipient {
public:
  virtual ~Recipient() = default;
  /// Short identifier for logs.
  virtual std::string describe() const = 0;
};

using RecipientPtr = std::shared_ptr<const Recipient>;

class Adapter {
public:
  virtual ~Adapter() = default;
  virtual Error resolve_recipient(const RawRecipient& raw, RecipientPtr& out) = 0;
  virtual Error send(const AppPacket& pkt, const std::vector<RecipientPtr>& recipients) = 0;
};

class Storage {
public:
  virtual ~Storage() = default;
  virtual Error lookup_devices(const DevAddr& addr, std::vector<DeviceEntry>& out) = 0;
  virtual Error store_device(const DeviceRegistration& reg) = 0;
  virtual Error store_application(const ApplicationRegistration& reg) = 0;
};

} // namespace lorabroker
