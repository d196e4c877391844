#pragma once
/**
 * @file device_registry.hpp
 * @brief In-memory device/application registry, the broker's Storage.
 *
 * @details
 * PURPOSE
 * -------
 * The broker only knows devices through a Storage. DeviceRegistry is the one
 * this repository ships: two mutex-guarded maps and an optional JSON snapshot
 * on disk so a CLI invocation can see what an earlier one registered.
 *
 * LAYOUT
 * ------
 * - DevAddr -> list of DeviceEntry. Several devices may share an address,
 *   the broker tells them apart by MIC.
 * - AppEUI  -> ApplicationEntry, one per application.
 *
 * RULES
 * -----
 * | Call                | Condition                          | Result        |
 * |---------------------|------------------------------------|---------------|
 * | store_device        | empty recipient                    | Structural    |
 * | store_device        | same (AppEUI, DevEUI) already held | replaced, even under a new DevAddr |
 * | store_application   | empty recipient                    | Structural    |
 * | store_application   | same AppEUI already held           | replaced      |
 * | lookup_devices      | no device under the DevAddr        | Behavioural   |
 * | any store, snapshot | snapshot write fails               | Operational   |
 *
 * A store whose snapshot write fails leaves the in-memory maps unchanged.
 *
 * SNAPSHOT FORMAT
 * ---------------
 * @code{.json}
 * {
 *   "devices": [
 *     { "devaddr": "02030203", "appeui": "0101010105050505",
 *       "deveui": "0404040402030203", "nwkskey": "...32 hex...",
 *       "recipient": "2F746D702F68616E646C6572" }
 *   ],
 *   "applications": [
 *     { "appeui": "0101010105050505", "recipient": "..." }
 *   ]
 * }
 * @endcode
 * Recipients are stored as hex because they are opaque bytes.
 * Written with temp file + rename so a crash never leaves half a file.
 */

#include "errors.hpp"
#include "interfaces.hpp"
#include "registration.hpp"
#include "types.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace lorabroker {

class DeviceRegistry : public Storage {
public:
  DeviceRegistry() = default;

  /// @brief Registry backed by `snapshot`. Nothing is read until load().
  explicit DeviceRegistry(std::filesystem::path snapshot);

  /// @brief Read the snapshot file. A missing file is an empty registry, not an error.
  Error load();

  Error lookup_devices(const DevAddr& addr, std::vector<DeviceEntry>& out) override;
  Error store_device(const DeviceRegistration& reg) override;
  Error store_application(const ApplicationRegistration& reg) override;

  /// @brief Application entry by AppEUI; false when unknown.
  bool find_application(const EUI64& app_eui, ApplicationEntry& out) const;

  size_t device_count() const;
  size_t application_count() const;

  const std::filesystem::path& snapshot_path() const { return snapshot_; }

private:
  using DeviceMap = std::map<DevAddr, std::vector<DeviceEntry>>;
  using AppMap    = std::map<EUI64, ApplicationEntry>;

  Error save_locked(const DeviceMap& devices, const AppMap& apps) const;

  mutable std::mutex    mu_;
  DeviceMap             devices_;
  AppMap                apps_;
  std::filesystem::path snapshot_;   // empty: memory only
};

} // namespace lorabroker
