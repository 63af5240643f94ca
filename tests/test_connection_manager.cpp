#include <catch2/catch.hpp>
#include "connection/connection_manager.h"
#include "test_support.h"
#include "utils/thread_pool.h"
#include <future>

using namespace llink;
using namespace llink::test;

namespace
{
    const std::string RADIO_PRINTER = "00:07:4D:C9:52:88";
    const std::string NETWORK_PRINTER = "192.168.1.20";

    struct ConnectionFixture
    {
        ConnectionFixture()
            : factory(std::make_shared<FakeTransportFactory>()),
              ioPool(4, 0, ThreadPool::RejectionPolicy::BLOCK),
              manager(config(), factory, ioPool, recorder.sink())
        {
        }

        static LabelConnectionConfig config()
        {
            LabelConnectionConfig config;
            config.timeoutMs = 300;
            config.settleDelayMs = 10;
            return config;
        }

        std::shared_ptr<FakeTransportFactory> factory;
        CoreEventRecorder recorder;
        ThreadPool ioPool;
        ConnectionManager manager;
    };
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: connect and disconnect", "[connection]")
{
    REQUIRE(manager.connect(RADIO_PRINTER, PrinterFamily::SMART_PRINTER).isSuccess());

    ConnectionState state = manager.getState();
    REQUIRE(state.isConnected());
    REQUIRE(state.address == RADIO_PRINTER);
    REQUIRE(factory->transportFor(RADIO_PRINTER)->isOpen());
    REQUIRE(recorder.phases() == std::vector<ConnectionPhase>{ConnectionPhase::CONNECTING, ConnectionPhase::CONNECTED});

    REQUIRE(manager.disconnect().isSuccess());
    REQUIRE(manager.getState().phase == ConnectionPhase::DISCONNECTED);
    REQUIRE_FALSE(manager.getState().address.has_value());
    REQUIRE_FALSE(factory->transportFor(RADIO_PRINTER)->isOpen());

    SECTION("disconnecting again is a quiet no-op")
    {
        size_t before = recorder.events().size();
        REQUIRE(manager.disconnect().isSuccess());
        REQUIRE(recorder.events().size() == before);
    }
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: switching printers keeps one connection", "[connection]")
{
    REQUIRE(manager.connect(RADIO_PRINTER, PrinterFamily::SMART_PRINTER).isSuccess());
    REQUIRE(manager.connect(NETWORK_PRINTER, PrinterFamily::GENERIC_SOCKET_PRINTER).isSuccess());

    REQUIRE_FALSE(factory->transportFor(RADIO_PRINTER)->isOpen());
    REQUIRE(factory->transportFor(NETWORK_PRINTER)->isOpen());
    REQUIRE(manager.getState().address == NETWORK_PRINTER);
    REQUIRE(manager.getState().family == PrinterFamily::GENERIC_SOCKET_PRINTER);

    REQUIRE(recorder.phases() == std::vector<ConnectionPhase>{
                                     ConnectionPhase::CONNECTING, ConnectionPhase::CONNECTED,
                                     ConnectionPhase::DISCONNECTING, ConnectionPhase::DISCONNECTED,
                                     ConnectionPhase::CONNECTING, ConnectionPhase::CONNECTED});
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: connecting to the current printer disconnects", "[connection]")
{
    REQUIRE(manager.connect(RADIO_PRINTER, PrinterFamily::SMART_PRINTER).isSuccess());
    REQUIRE(manager.connect(RADIO_PRINTER, PrinterFamily::SMART_PRINTER).isSuccess());
    REQUIRE(manager.getState().phase == ConnectionPhase::DISCONNECTED);
    REQUIRE(factory->created == 1);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: address validation", "[connection]")
{
    REQUIRE(manager.connect("", PrinterFamily::SMART_PRINTER).code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    REQUIRE(manager.connect(" 192.168.1.20", PrinterFamily::SMART_PRINTER).code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    REQUIRE(manager.connect(std::string(256, 'a'), PrinterFamily::SMART_PRINTER).code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    REQUIRE(recorder.events().empty());
    REQUIRE(factory->created == 0);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: connection failures end disconnected", "[connection]")
{
    SECTION("no transport for the address")
    {
        factory->unavailable[NETWORK_PRINTER] = true;
        auto result = manager.connect(NETWORK_PRINTER, PrinterFamily::SMART_PRINTER);
        REQUIRE(result.code == LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR);
        REQUIRE(result.message == "No network transport available for 192.168.1.20");
    }

    SECTION("open refused")
    {
        factory->transportFor(NETWORK_PRINTER)->openResult =
            VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR, "connection refused");
        auto result = manager.connect(NETWORK_PRINTER, PrinterFamily::SMART_PRINTER);
        REQUIRE(result.code == LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR);
        REQUIRE(result.message == "Connection failed: connection refused");
    }

    SECTION("open hangs past the timeout")
    {
        auto transport = factory->transportFor(NETWORK_PRINTER);
        transport->openDelayMs = 5000;
        auto result = manager.connect(NETWORK_PRINTER, PrinterFamily::SMART_PRINTER);
        REQUIRE(result.code == LLINK_ERROR_CODE::OPERATION_TIMEOUT);
        REQUIRE(result.message == "Connection timed out after 300 ms");
        REQUIRE(transport->closeCalls >= 1);
    }

    REQUIRE(manager.getState().phase == ConnectionPhase::DISCONNECTED);
    REQUIRE(recorder.phases().back() == ConnectionPhase::DISCONNECTED);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: one connection attempt at a time", "[connection]")
{
    factory->transportFor(RADIO_PRINTER)->openDelayMs = 200;
    auto first = std::async(std::launch::async, [this]
                            { return manager.connect(RADIO_PRINTER, PrinterFamily::SMART_PRINTER); });
    REQUIRE(waitUntil([this]
                      { return manager.getState().phase == ConnectionPhase::CONNECTING; }));

    auto second = manager.connect(NETWORK_PRINTER, PrinterFamily::SMART_PRINTER);
    REQUIRE(second.code == LLINK_ERROR_CODE::OPERATION_IN_PROGRESS);
    REQUIRE(first.get().isSuccess());
    REQUIRE(manager.getState().address == RADIO_PRINTER);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: disconnect cancels a pending connect", "[connection]")
{
    factory->transportFor(RADIO_PRINTER)->openDelayMs = 2000;
    auto pending = std::async(std::launch::async, [this]
                              { return manager.connect(RADIO_PRINTER, PrinterFamily::SMART_PRINTER); });
    REQUIRE(waitUntil([this]
                      { return manager.getState().phase == ConnectionPhase::CONNECTING; }));

    REQUIRE(manager.disconnect().isSuccess());
    REQUIRE(pending.get().code == LLINK_ERROR_CODE::OPERATION_CANCELLED);
    REQUIRE(manager.getState().phase == ConnectionPhase::DISCONNECTED);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: isConnected probes the transport", "[connection]")
{
    REQUIRE_FALSE(manager.isConnected());
    REQUIRE(manager.connect(NETWORK_PRINTER, PrinterFamily::SMART_PRINTER).isSuccess());
    REQUIRE(manager.isConnected());
    REQUIRE(factory->transportFor(NETWORK_PRINTER)->statusQueries >= 1);

    factory->transportFor(NETWORK_PRINTER)->dropConnection();
    REQUIRE_FALSE(manager.isConnected());
    REQUIRE(manager.getState().phase == ConnectionPhase::DISCONNECTED);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: leases", "[connection]")
{
    REQUIRE_FALSE(manager.acquireLease().has_value());
    REQUIRE(manager.connect(NETWORK_PRINTER, PrinterFamily::SMART_PRINTER).isSuccess());
    auto transport = factory->transportFor(NETWORK_PRINTER);

    auto lease = manager.acquireLease();
    REQUIRE(lease.has_value());
    REQUIRE(lease->transport == transport);
    REQUIRE(lease->state.address == NETWORK_PRINTER);

    // A probe from another thread during a lease does not touch the transport
    int queries = transport->statusQueries;
    auto probe = std::async(std::launch::async, [this]
                            { return manager.isConnected(); });
    REQUIRE(probe.get());
    REQUIRE(transport->statusQueries == queries);
    lease.reset();

    SECTION("failure of a stale transport is ignored")
    {
        manager.handleTransportFailure(std::make_shared<FakeTransport>(), "old transport");
        REQUIRE(manager.getState().isConnected());
    }

    SECTION("failure of the active transport tears down")
    {
        manager.handleTransportFailure(transport, "write failed");
        REQUIRE(manager.getState().phase == ConnectionPhase::DISCONNECTED);
        REQUIRE_FALSE(transport->isOpen());
    }
}
