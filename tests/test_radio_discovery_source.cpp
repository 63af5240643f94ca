#include <catch2/catch.hpp>
#include "discovery/network_discovery_source.h"
#include "discovery/radio_discovery_source.h"
#include "test_support.h"

using namespace llink;
using namespace llink::test;

namespace
{
    struct CallbackLog
    {
        std::mutex mutex;
        std::vector<Device> found;
        std::vector<Device> gone;
        int finished = 0;
        std::vector<std::pair<DiscoveryErrorKind, std::string>> errors;

        DiscoverySourceCallbacks callbacks()
        {
            DiscoverySourceCallbacks callbacks;
            callbacks.onFound = [this](const Device &device)
            {
                std::lock_guard<std::mutex> lock(mutex);
                found.push_back(device);
            };
            callbacks.onGone = [this](const Device &device)
            {
                std::lock_guard<std::mutex> lock(mutex);
                gone.push_back(device);
            };
            callbacks.onFinished = [this]()
            {
                std::lock_guard<std::mutex> lock(mutex);
                ++finished;
            };
            callbacks.onError = [this](DiscoveryErrorKind kind, const std::string &message)
            {
                std::lock_guard<std::mutex> lock(mutex);
                errors.emplace_back(kind, message);
            };
            return callbacks;
        }
    };
}

TEST_CASE("RadioDiscoverySource: permission", "[radio]")
{
    auto scanner = std::make_shared<FakeRadioScanner>();
    RadioDiscoverySource source(scanner);

    SECTION("granted")
    {
        REQUIRE(source.checkPermission().isSuccess());
        REQUIRE(scanner->permissionRequests == 0);
    }

    SECTION("denied then granted on request")
    {
        scanner->permission = RadioPermission::DENIED;
        scanner->grantOnRequest = true;
        REQUIRE(source.checkPermission().isSuccess());
        REQUIRE(scanner->permissionRequests == 1);
    }

    SECTION("denied and refused")
    {
        scanner->permission = RadioPermission::DENIED;
        auto result = source.checkPermission();
        REQUIRE(result.code == LLINK_ERROR_CODE::PERMISSION_DENIED);
    }

    SECTION("no scanner")
    {
        RadioDiscoverySource orphan(nullptr);
        REQUIRE(orphan.checkPermission().code == LLINK_ERROR_CODE::DISCOVERY_FAILED);
    }
}

TEST_CASE("RadioDiscoverySource: unavailable radio is reported as an error", "[radio]")
{
    auto scanner = std::make_shared<FakeRadioScanner>();
    RadioDiscoverySource source(scanner);
    CallbackLog log;

    SECTION("radio switched off")
    {
        scanner->radioEnabled = false;
        source.start(log.callbacks());
        REQUIRE(log.errors.size() == 1);
        REQUIRE(log.errors[0].first == DiscoveryErrorKind::RADIO_DISABLED);
        REQUIRE(log.errors[0].second == RadioDiscoverySource::RADIO_DISABLED_MESSAGE);
        REQUIRE(scanner->scanStarts == 0);
    }

    SECTION("location service off")
    {
        scanner->permission = RadioPermission::LOCATION_SERVICE_OFF;
        source.start(log.callbacks());
        REQUIRE(log.errors.size() == 1);
        REQUIRE(log.errors[0].first == DiscoveryErrorKind::LOCATION_DISABLED);
        REQUIRE(log.errors[0].second == "Your location service is off.");
    }

    SECTION("scan refused by the platform")
    {
        scanner->scanStartSucceeds = false;
        source.start(log.callbacks());
        REQUIRE(log.errors.size() == 1);
        REQUIRE(log.errors[0].first == DiscoveryErrorKind::GENERAL);
    }
}

TEST_CASE("RadioDiscoverySource: scan results", "[radio]")
{
    auto scanner = std::make_shared<FakeRadioScanner>();
    RadioDiscoverySource source(scanner);
    CallbackLog log;
    source.start(log.callbacks());
    REQUIRE(scanner->scanStarts == 1);

    auto scan = scanner->callbacks();
    scan.onDeviceFound("00:07:4D:C9:52:88", "ZQ520");
    scan.onDeviceFound("00:07:4D:C9:52:99", "");

    REQUIRE(log.found.size() == 2);
    REQUIRE(log.found[0].displayName == "ZQ520");
    REQUIRE_FALSE(log.found[0].isWifi);
    REQUIRE(log.found[1].displayName == "00:07:4D:C9:52:99");

    scan.onDeviceLost("00:07:4D:C9:52:99");
    REQUIRE(log.gone.size() == 1);

    SECTION("errors are classified by their text")
    {
        scan.onError("Bluetooth radio is currently disabled");
        REQUIRE(log.errors.size() == 1);
        REQUIRE(log.errors[0].first == DiscoveryErrorKind::RADIO_DISABLED);
    }

    SECTION("stop cancels the scan and silences the old run")
    {
        source.stop();
        REQUIRE(scanner->scanCancels == 1);
        scan.onDeviceFound("00:07:4D:C9:52:AA", "Late");
        scan.onFinished();
        REQUIRE(log.found.size() == 2);
        REQUIRE(log.finished == 0);
    }

    SECTION("a new run replays known devices first")
    {
        source.stop();
        CallbackLog second;
        source.start(second.callbacks());
        REQUIRE(second.found.size() == 1);
        REQUIRE(second.found[0].address == "00:07:4D:C9:52:88");
    }
}

TEST_CASE("RadioDiscoverySource: scanner callbacks outlive the source", "[radio]")
{
    auto scanner = std::make_shared<FakeRadioScanner>();
    auto source = std::make_unique<RadioDiscoverySource>(scanner);
    CallbackLog log;
    source->start(log.callbacks());

    auto scan = scanner->callbacks();
    scan.onDeviceFound("00:07:4D:C9:52:88", "ZQ520");
    REQUIRE(log.found.size() == 1);

    source.reset();
    REQUIRE(scanner->scanCancels == 1);

    scan.onDeviceFound("00:07:4D:C9:52:99", "Late");
    scan.onDeviceLost("00:07:4D:C9:52:88");
    scan.onFinished();
    scan.onError("adapter busy");
    REQUIRE(log.found.size() == 1);
    REQUIRE(log.gone.empty());
    REQUIRE(log.finished == 0);
    REQUIRE(log.errors.empty());
}

TEST_CASE("RadioDiscoverySource: classifyError", "[radio]")
{
    REQUIRE(RadioDiscoverySource::classifyError("Bluetooth Radio is currently disabled") == DiscoveryErrorKind::RADIO_DISABLED);
    REQUIRE(RadioDiscoverySource::classifyError("adapter busy") == DiscoveryErrorKind::GENERAL);
}

TEST_CASE("LabelPrinterDiscoveryStrategy: reply parsing", "[network]")
{
    LabelPrinterDiscoveryStrategy strategy(4201);
    REQUIRE(strategy.getDiscoveryMessage() == std::string("\x2e\x2c\x3a\x01\x00\x00", 6));
    REQUIRE(strategy.getDefaultPort() == 4201);

    std::string reply(128, '\0');
    reply[0] = 0x3a;
    reply[1] = 0x2c;
    reply[2] = 0x2e;

    SECTION("system name wins")
    {
        reply.replace(LabelPrinterDiscoveryStrategy::PRODUCT_NAME_OFFSET, 5, "ZD421");
        reply.replace(LabelPrinterDiscoveryStrategy::SYSTEM_NAME_OFFSET, 9, "Shipping1");
        auto device = strategy.parseResponse(reply, "192.168.1.20", 4201);
        REQUIRE(device != nullptr);
        REQUIRE(device->address == "192.168.1.20");
        REQUIRE(device->displayName == "Shipping1");
        REQUIRE(device->isWifi);
    }

    SECTION("product name when no system name")
    {
        reply.replace(LabelPrinterDiscoveryStrategy::PRODUCT_NAME_OFFSET, 5, "ZD421");
        auto device = strategy.parseResponse(reply, "192.168.1.20", 4201);
        REQUIRE(device->displayName == "ZD421");
    }

    SECTION("address when no names")
    {
        auto device = strategy.parseResponse(reply, "192.168.1.20", 4201);
        REQUIRE(device->displayName == "192.168.1.20");
    }

    SECTION("foreign datagrams are ignored")
    {
        REQUIRE(strategy.parseResponse("hello", "192.168.1.20", 4201) == nullptr);
        REQUIRE(strategy.parseResponse(reply, "not-an-ip", 4201) == nullptr);
    }
}
