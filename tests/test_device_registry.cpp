#include <doctest/doctest.h>
#include "lorabroker/device_registry.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>  // getpid

using namespace lorabroker;
namespace fs = std::filesystem;

namespace {

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& name) {
        path = fs::temp_directory_path() / ("lorabroker-" + name + "-" + std::to_string(::getpid()));
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::create_directories(path);
    }
    ~TempDir() { std::error_code ec; fs::remove_all(path, ec); }
};

DeviceRegistration reg(uint8_t tag, const DevAddr& addr) {
    DeviceRegistration r;
    r.recipient = RawRecipient{'/', 't', 'm', 'p', '/', static_cast<uint8_t>('a' + tag)};
    r.devaddr   = addr;
    r.app_eui.fill(tag);
    r.dev_eui.fill(static_cast<uint8_t>(tag + 0x10));
    r.nwk_skey.fill(static_cast<uint8_t>(tag + 0x20));
    return r;
}

const DevAddr kA{1, 1, 1, 1};
const DevAddr kB{2, 2, 2, 2};

} // namespace

TEST_CASE("Lookup of an unknown address is behavioural") {
    DeviceRegistry r;
    std::vector<DeviceEntry> out;
    CHECK(r.lookup_devices(kA, out).is(ErrorKind::Behavioural));
    CHECK(out.empty());
}

TEST_CASE("Devices sharing an address are all returned, in registration order") {
    DeviceRegistry r;
    REQUIRE_FALSE(r.store_device(reg(1, kA)));
    REQUIRE_FALSE(r.store_device(reg(2, kA)));
    REQUIRE_FALSE(r.store_device(reg(3, kB)));

    std::vector<DeviceEntry> out;
    REQUIRE_FALSE(r.lookup_devices(kA, out));
    REQUIRE(out.size() == 2);
    CHECK(out[0] == reg(1, kA).entry());
    CHECK(out[1] == reg(2, kA).entry());
    CHECK(r.device_count() == 3);
}

TEST_CASE("Re-registering a device replaces it, even under a new address") {
    DeviceRegistry r;
    REQUIRE_FALSE(r.store_device(reg(1, kA)));
    DeviceRegistration moved = reg(1, kB);
    moved.nwk_skey.fill(0x77);
    REQUIRE_FALSE(r.store_device(moved));

    std::vector<DeviceEntry> out;
    CHECK(r.lookup_devices(kA, out).is(ErrorKind::Behavioural));
    REQUIRE_FALSE(r.lookup_devices(kB, out));
    REQUIRE(out.size() == 1);
    CHECK(out[0].nwk_skey[0] == 0x77);
    CHECK(r.device_count() == 1);
}

TEST_CASE("Registrations without a recipient are structural") {
    DeviceRegistry r;
    DeviceRegistration d = reg(1, kA);
    d.recipient.clear();
    CHECK(r.store_device(d).is(ErrorKind::Structural));
    CHECK(r.store_application(ApplicationRegistration{RawRecipient{}, EUI64{}}).is(ErrorKind::Structural));
    CHECK(r.device_count() == 0);
    CHECK(r.application_count() == 0);
}

TEST_CASE("Applications are keyed by AppEUI") {
    DeviceRegistry r;
    const EUI64 eui{9, 9, 9, 9, 9, 9, 9, 9};
    REQUIRE_FALSE(r.store_application(ApplicationRegistration{RawRecipient{'-'}, eui}));
    REQUIRE_FALSE(r.store_application(ApplicationRegistration{RawRecipient{'/', 'h'}, eui}));

    ApplicationEntry e;
    REQUIRE(r.find_application(eui, e));
    CHECK(e.recipient == RawRecipient{'/', 'h'});
    CHECK(r.application_count() == 1);
    CHECK_FALSE(r.find_application(EUI64{}, e));
}

TEST_CASE("Snapshot survives a reload") {
    TempDir dir("snapshot");
    const fs::path file = dir.path / "state" / "registry.json";
    {
        DeviceRegistry r(file);
        REQUIRE_FALSE(r.load());              // missing file: empty registry
        REQUIRE_FALSE(r.store_device(reg(1, kA)));
        REQUIRE_FALSE(r.store_device(reg(2, kA)));
        REQUIRE_FALSE(r.store_application(ApplicationRegistration{RawRecipient{'-'}, EUI64{1, 1, 1, 1, 1, 1, 1, 1}}));
    }
    REQUIRE(fs::exists(file));
    CHECK_FALSE(fs::exists(fs::path(file.string() + ".tmp")));

    DeviceRegistry again(file);
    REQUIRE_FALSE(again.load());
    std::vector<DeviceEntry> out;
    REQUIRE_FALSE(again.lookup_devices(kA, out));
    REQUIRE(out.size() == 2);
    CHECK(out[0] == reg(1, kA).entry());
    CHECK(out[1] == reg(2, kA).entry());
    CHECK(again.application_count() == 1);
}

TEST_CASE("A corrupt snapshot is operational and leaves the registry empty") {
    TempDir dir("corrupt");
    const fs::path file = dir.path / "registry.json";

    SUBCASE("not JSON") {
        std::ofstream(file) << "{ this is not json";
    }
    SUBCASE("bad field") {
        std::ofstream(file) << R"({"devices":[{"devaddr":"XYZ","appeui":"00","deveui":"00","nwkskey":"00","recipient":"2F"}]})";
    }

    DeviceRegistry r(file);
    CHECK(r.load().is(ErrorKind::Operational));
    CHECK(r.device_count() == 0);
}

TEST_CASE("An unwritable snapshot fails the store and keeps memory unchanged") {
    TempDir dir("readonly");
    // a directory where the file should be: rename onto it fails
    const fs::path file = dir.path / "registry.json";
    fs::create_directories(file / "blocker");

    DeviceRegistry r(file);
    CHECK(r.store_device(reg(1, kA)).is(ErrorKind::Operational));
    CHECK(r.device_count() == 0);
}
