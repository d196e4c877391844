// ============================================================================
// device_registry.cpp: implementation for device_registry.hpp
// Rules table and snapshot format live in the header.
// ============================================================================
#include "lorabroker/device_registry.hpp"

#include "nlohmann/json.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace lorabroker {

// -------- helpers --------

static bool same_device(const DeviceEntry& a, const DeviceEntry& b) {
    return a.app_eui == b.app_eui && a.dev_eui == b.dev_eui;
}

// Remove any entry for the same (AppEUI, DevEUI) under any address.
static void erase_device(std::map<DevAddr, std::vector<DeviceEntry>>& devices, const DeviceEntry& e) {
    for (auto it = devices.begin(); it != devices.end(); ) {
        auto& list = it->second;
        for (auto li = list.begin(); li != list.end(); ) {
            if (same_device(*li, e)) li = list.erase(li);
            else ++li;
        }
        if (list.empty()) it = devices.erase(it);
        else ++it;
    }
}

template <size_t N>
static bool read_hex_field(const json& j, const char* key, std::array<uint8_t, N>& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return false;
    return from_hex(it->get<std::string>(), out);
}

static bool read_recipient(const json& j, RawRecipient& out) {
    auto it = j.find("recipient");
    if (it == j.end() || !it->is_string()) return false;
    return hex_to_bytes(it->get<std::string>(), out) && !out.empty();
}

// temp file + rename, same as every other state file we write
static Error atomic_write_json(const fs::path& p, const json& j) {
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) return Error(ErrorKind::Operational, "registry dir: " + ec.message());
    }
    auto tmp = p; tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return Error(ErrorKind::Operational, "open " + tmp.string() + " failed");
        out << j.dump(2) << '\n';
        out.flush();
        if (!out) return Error(ErrorKind::Operational, "write " + tmp.string() + " failed");
    }
    fs::rename(tmp, p, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error(ErrorKind::Operational, "rename to " + p.string() + " failed");
    }
    return Error();
}

// -------- public API --------

DeviceRegistry::DeviceRegistry(fs::path snapshot) : snapshot_(std::move(snapshot)) {}

Error DeviceRegistry::load() {
    if (snapshot_.empty()) return Error();

    std::error_code ec;
    if (!fs::exists(snapshot_, ec)) return Error();   // first run

    std::ifstream in(snapshot_);
    if (!in) return Error(ErrorKind::Operational, "open " + snapshot_.string() + " failed");

    DeviceMap devices;
    AppMap    apps;
    try {
        json j = json::parse(in);
        if (!j.is_object())
            return Error(ErrorKind::Operational, "registry: top level is not an object");

        if (auto d = j.find("devices"); d != j.end()) {
            if (!d->is_array()) return Error(ErrorKind::Operational, "registry: devices is not an array");
            for (const auto& rec : *d) {
                DevAddr addr{};
                DeviceEntry e;
                if (!rec.is_object()
                    || !read_hex_field(rec, "devaddr", addr)
                    || !read_hex_field(rec, "appeui",  e.app_eui)
                    || !read_hex_field(rec, "deveui",  e.dev_eui)
                    || !read_hex_field(rec, "nwkskey", e.nwk_skey)
                    || !read_recipient(rec, e.recipient))
                    return Error(ErrorKind::Operational, "registry: bad device record");
                erase_device(devices, e);
                devices[addr].push_back(std::move(e));
            }
        }

        if (auto a = j.find("applications"); a != j.end()) {
            if (!a->is_array()) return Error(ErrorKind::Operational, "registry: applications is not an array");
            for (const auto& rec : *a) {
                ApplicationEntry e;
                if (!rec.is_object()
                    || !read_hex_field(rec, "appeui", e.app_eui)
                    || !read_recipient(rec, e.recipient))
                    return Error(ErrorKind::Operational, "registry: bad application record");
                apps[e.app_eui] = std::move(e);
            }
        }
    } catch (const json::exception& ex) {
        return Error(ErrorKind::Operational, std::string("registry: ") + ex.what());
    }

    std::lock_guard<std::mutex> lock(mu_);
    devices_ = std::move(devices);
    apps_    = std::move(apps);
    return Error();
}

Error DeviceRegistry::save_locked(const DeviceMap& devices, const AppMap& apps) const {
    if (snapshot_.empty()) return Error();

    json j;
    j["devices"]      = json::array();
    j["applications"] = json::array();
    for (const auto& kv : devices) {
        for (const auto& e : kv.second) {
            j["devices"].push_back({
                {"devaddr",   to_hex(kv.first)},
                {"appeui",    to_hex(e.app_eui)},
                {"deveui",    to_hex(e.dev_eui)},
                {"nwkskey",   to_hex(e.nwk_skey)},
                {"recipient", bytes_to_hex(e.recipient.data(), e.recipient.size())}
            });
        }
    }
    for (const auto& kv : apps) {
        j["applications"].push_back({
            {"appeui",    to_hex(kv.second.app_eui)},
            {"recipient", bytes_to_hex(kv.second.recipient.data(), kv.second.recipient.size())}
        });
    }
    return atomic_write_json(snapshot_, j);
}

Error DeviceRegistry::lookup_devices(const DevAddr& addr, std::vector<DeviceEntry>& out) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = devices_.find(addr);
    if (it == devices_.end() || it->second.empty())
        return Error(ErrorKind::Behavioural, "no device registered for devaddr " + to_hex(addr));
    out = it->second;
    return Error();
}

Error DeviceRegistry::store_device(const DeviceRegistration& reg) {
    if (reg.recipient.empty())
        return Error(ErrorKind::Structural, "device registration without recipient");

    std::lock_guard<std::mutex> lock(mu_);
    DeviceMap next = devices_;
    DeviceEntry e = reg.entry();
    erase_device(next, e);
    next[reg.devaddr].push_back(std::move(e));

    if (Error err = save_locked(next, apps_)) return err;
    devices_ = std::move(next);
    return Error();
}

Error DeviceRegistry::store_application(const ApplicationRegistration& reg) {
    if (reg.recipient.empty())
        return Error(ErrorKind::Structural, "application registration without recipient");

    std::lock_guard<std::mutex> lock(mu_);
    AppMap next = apps_;
    next[reg.app_eui] = reg.entry();

    if (Error err = save_locked(devices_, next)) return err;
    apps_ = std::move(next);
    return Error();
}

bool DeviceRegistry::find_application(const EUI64& app_eui, ApplicationEntry& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = apps_.find(app_eui);
    if (it == apps_.end()) return false;
    out = it->second;
    return true;
}

size_t DeviceRegistry::device_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& kv : devices_) n += kv.second.size();
    return n;
}

size_t DeviceRegistry::application_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return apps_.size();
}

} // namespace lorabroker
