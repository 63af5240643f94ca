#include <catch2/catch.hpp>
#include "storage/last_device_repository.h"
#include "test_support.h"

using namespace llink;

TEST_CASE("LastDeviceRepository: save and load", "[last_device]")
{
    auto store = std::make_shared<test::FakeLastDeviceStore>();
    LastDeviceRepository repository(store);

    LastDevice device;
    device.address = "00:07:4D:C9:52:88";
    device.displayName = "Warehouse label printer";
    device.isWifi = false;
    device.family = PrinterFamily::GENERIC_SOCKET_PRINTER;

    REQUIRE(repository.save(device).isSuccess());
    REQUIRE(store->values.count(LastDeviceRepository::STORAGE_KEY) == 1);

    auto loaded = repository.load();
    REQUIRE(loaded.isSuccess());
    REQUIRE(loaded.value().address == device.address);
    REQUIRE(loaded.value().displayName == device.displayName);
    REQUIRE(loaded.value().family == PrinterFamily::GENERIC_SOCKET_PRINTER);

    REQUIRE(repository.clear().isSuccess());
    REQUIRE(repository.load().code == LLINK_ERROR_CODE::PRINTER_NOT_FOUND);
}

TEST_CASE("LastDeviceRepository: failures", "[last_device]")
{
    auto store = std::make_shared<test::FakeLastDeviceStore>();
    LastDeviceRepository repository(store);

    SECTION("nothing stored")
    {
        REQUIRE(repository.load().code == LLINK_ERROR_CODE::PRINTER_NOT_FOUND);
    }

    SECTION("empty address is rejected")
    {
        REQUIRE(repository.save(LastDevice{}).code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    }

    SECTION("store refuses the write")
    {
        store->rejectWrites = true;
        LastDevice device;
        device.address = "192.168.1.50";
        REQUIRE(repository.save(device).code == LLINK_ERROR_CODE::UNKNOWN_ERROR);
    }

    SECTION("corrupt blob")
    {
        store->values[LastDeviceRepository::STORAGE_KEY] = "{not json";
        REQUIRE(repository.load().code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    }
}

TEST_CASE("InMemoryLastDeviceStore", "[last_device]")
{
    InMemoryLastDeviceStore store;
    REQUIRE_FALSE(store.load("key").has_value());
    REQUIRE(store.save("key", "value"));
    REQUIRE(store.load("key") == std::string("value"));
    REQUIRE(store.remove("key"));
    REQUIRE_FALSE(store.remove("key"));
}
