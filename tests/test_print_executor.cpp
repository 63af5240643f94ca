#include <catch2/catch.hpp>
#include "print/print_executor.h"
#include "print/print_verifier.h"
#include "print/printer_commands.h"
#include "test_support.h"
#include "types/event.h"

using namespace llink;
using namespace llink::test;

namespace
{
    const std::string PRINTER = "192.168.1.20";
    const std::string LABEL = "^XA^FDHello^XZ";

    struct PrintFixture
    {
        PrintFixture()
            : bus(std::make_shared<EventBus>()),
              reconciler(bus),
              factory(std::make_shared<FakeTransportFactory>()),
              ioPool(4, 0, ThreadPool::RejectionPolicy::BLOCK),
              connection(fastConfig().connection, factory, ioPool,
                         [this](CoreEvent event)
                         { return reconciler.post(std::move(event)); }),
              executor(printConfig(), connection, reconciler, ioPool)
        {
            bus->subscribe<PrintJobEvent>([this](const std::shared_ptr<PrintJobEvent> &event)
                                          {
                std::lock_guard<std::mutex> lock(jobEventsMutex);
                jobEvents.push_back(event->job.status); });
        }

        static LabelPrintConfig printConfig()
        {
            LabelPrintConfig config = fastConfig().print;
            config.timeoutMs = 300;
            return config;
        }

        std::shared_ptr<FakeTransport> connect(PrinterFamily family)
        {
            auto transport = factory->transportFor(PRINTER);
            REQUIRE(connection.connect(PRINTER, family).isSuccess());
            return transport;
        }

        std::vector<PrintJobStatus> jobStatuses()
        {
            reconciler.drain();
            std::lock_guard<std::mutex> lock(jobEventsMutex);
            return jobEvents;
        }

        std::shared_ptr<EventBus> bus;
        std::mutex jobEventsMutex;
        std::vector<PrintJobStatus> jobEvents;
        EventReconciler reconciler;
        std::shared_ptr<FakeTransportFactory> factory;
        ThreadPool ioPool;
        ConnectionManager connection;
        PrintExecutor executor;
    };
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: printing requires a connection", "[print]")
{
    auto transport = factory->transportFor(PRINTER);
    auto result = executor.print(LABEL);

    REQUIRE(result.code == LLINK_ERROR_CODE::PRINTER_NOT_CONNECTED);
    REQUIRE(result.message == "Printer is not connected");
    REQUIRE(transport->writtenData().empty());
    REQUIRE(jobStatuses().empty());
    REQUIRE(reconciler.printJobs().size() == 0);
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: payload validation", "[print]")
{
    connect(PrinterFamily::SMART_PRINTER);

    REQUIRE(executor.print("").code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    REQUIRE(executor.print(std::string(PrintExecutor::MAX_PAYLOAD_SIZE + 1, 'x')).code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    REQUIRE(executor.print(LABEL, std::string("  ")).code == LLINK_ERROR_CODE::INVALID_PARAMETER);

    REQUIRE(executor.print(LABEL, std::string("job-1")).isSuccess());
    REQUIRE(executor.print(LABEL, std::string("job-1")).code == LLINK_ERROR_CODE::INVALID_PARAMETER);
    REQUIRE(executor.print(std::string(PrintExecutor::MAX_PAYLOAD_SIZE, 'x')).isSuccess());
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: smart printer success", "[print]")
{
    auto transport = connect(PrinterFamily::SMART_PRINTER);
    auto result = executor.print(LABEL, std::string("label-1"));

    REQUIRE(result.isSuccess());
    REQUIRE(result.value().id == "label-1");
    REQUIRE(result.value().status == PrintJobStatus::COMPLETED);
    REQUIRE(transport->writtenData() == std::vector<std::string>{"^XA^PON^FDHello^XZ"});
    REQUIRE(transport->statusQueries >= 1);
    REQUIRE(jobStatuses() == std::vector<PrintJobStatus>{PrintJobStatus::QUEUED, PrintJobStatus::PRINTING,
                                                          PrintJobStatus::COMPLETED});
    REQUIRE(connection.getState().isConnected());
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: printer faults fail the job", "[print]")
{
    auto transport = connect(PrinterFamily::SMART_PRINTER);
    PrinterStatusFlags flags;
    flags.isPaperOut = true;
    transport->status = flags;

    auto result = executor.print(LABEL);
    REQUIRE(result.code == LLINK_ERROR_CODE::PRINT_FAULT_PAPER_OUT);
    REQUIRE(result.message == "Paper out");
    REQUIRE(result.data.has_value());
    REQUIRE(result.data->status == PrintJobStatus::FAILED);
    REQUIRE(result.data->errorMessage == std::string("Paper out"));

    // A fault is not a lost connection
    REQUIRE(connection.getState().isConnected());
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: rotation", "[print]")
{
    auto transport = connect(PrinterFamily::SMART_PRINTER);
    REQUIRE(executor.toggleRotation());
    REQUIRE(executor.isRotated());
    REQUIRE(executor.print(LABEL).isSuccess());
    REQUIRE_FALSE(executor.toggleRotation());
    REQUIRE(executor.print(LABEL).isSuccess());

    auto written = transport->writtenData();
    REQUIRE(written.size() == 2);
    REQUIRE(written[0] == "^XA^POI^FDHello^XZ");
    REQUIRE(written[1] == "^XA^PON^FDHello^XZ");
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: generic printer gets a trailing cut", "[print]")
{
    auto transport = connect(PrinterFamily::GENERIC_SOCKET_PRINTER);
    REQUIRE(executor.print(LABEL).isSuccess());

    auto written = transport->writtenData();
    REQUIRE(written.size() == 2);
    REQUIRE(written[1] == PrinterCommands::cutSequence());
    REQUIRE(transport->statusQueries == 0);
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: write failure drops the connection", "[print]")
{
    auto transport = connect(PrinterFamily::SMART_PRINTER);
    transport->writeResult = VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, "broken pipe");

    auto result = executor.print(LABEL);
    REQUIRE(result.code == LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST);
    REQUIRE(result.message == "Connection error: broken pipe");
    REQUIRE(connection.getState().phase == ConnectionPhase::DISCONNECTED);
    REQUIRE(jobStatuses().back() == PrintJobStatus::FAILED);
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: transport exceptions", "[print]")
{
    auto transport = connect(PrinterFamily::SMART_PRINTER);

    SECTION("a throwing write is a lost connection")
    {
        transport->throwOnWrite = true;

        auto result = executor.print(LABEL);
        REQUIRE(result.code == LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST);
        REQUIRE(result.message == "Connection error: radio link dropped");
        REQUIRE(result.data->status == PrintJobStatus::FAILED);
        REQUIRE(connection.getState().phase == ConnectionPhase::DISCONNECTED);
        REQUIRE(transport->closeCalls >= 1);
    }

    SECTION("a throwing status query counts as success")
    {
        transport->throwOnStatus = true;

        auto result = executor.print(LABEL);
        REQUIRE(result.isSuccess());
        REQUIRE(result.value().status == PrintJobStatus::COMPLETED);
        REQUIRE(transport->writtenData().size() == 1);
        REQUIRE(connection.getState().isConnected());
    }
}

TEST_CASE_METHOD(PrintFixture, "PrintExecutor: hung write times out", "[print][timeout]")
{
    auto transport = connect(PrinterFamily::SMART_PRINTER);
    transport->writeDelayMs = 5000;

    auto result = executor.print(LABEL);
    REQUIRE(result.code == LLINK_ERROR_CODE::OPERATION_TIMEOUT);
    REQUIRE(result.message == "Print operation timed out after 300 ms");
    REQUIRE(result.data->status == PrintJobStatus::FAILED);

    REQUIRE(waitUntil([this]
                      { return connection.getState().phase == ConnectionPhase::DISCONNECTED; }));
    REQUIRE(executor.print(LABEL).code == LLINK_ERROR_CODE::PRINTER_NOT_CONNECTED);
}

TEST_CASE("SmartPrintVerifier: fault priority", "[print]")
{
    PrinterStatusFlags flags;
    flags.isHeadOpen = true;
    flags.isPaused = true;
    REQUIRE(SmartPrintVerifier::classifyStatus(flags).code == LLINK_ERROR_CODE::PRINT_FAULT_HEAD_OPEN);

    flags.isPaperOut = true;
    REQUIRE(SmartPrintVerifier::classifyStatus(flags).message == "Paper out");

    PrinterStatusFlags unknown;
    REQUIRE(SmartPrintVerifier::classifyStatus(unknown).code == LLINK_ERROR_CODE::PRINT_FAULT_NOT_READY);
    REQUIRE(SmartPrintVerifier::classifyStatus(readyStatus()).isSuccess());
}

TEST_CASE("SmartPrintVerifier: missing status counts as success", "[print]")
{
    FakeTransport transport;
    REQUIRE(transport.open().isSuccess());
    transport.status = std::nullopt;

    SmartPrintVerifier verifier(0);
    std::atomic<bool> abandoned{false};
    REQUIRE(verifier.verify(transport, abandoned).isSuccess());
}

TEST_CASE("GenericPrintVerifier: closed socket", "[print]")
{
    FakeTransport transport;
    GenericPrintVerifier verifier(0);
    std::atomic<bool> abandoned{false};

    auto result = verifier.verify(transport, abandoned);
    REQUIRE(result.code == LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST);
    REQUIRE(result.message == "Connection lost during printing");
}

TEST_CASE("GenericPrintVerifier: throwing transport", "[print]")
{
    FakeTransport transport;
    REQUIRE(transport.open().isSuccess());
    GenericPrintVerifier verifier(0);
    std::atomic<bool> abandoned{false};

    SECTION("state check")
    {
        transport.throwOnIsOpen = true;
        auto result = verifier.verify(transport, abandoned);
        REQUIRE(result.code == LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST);
        REQUIRE(result.message == "Connection lost during printing");
    }

    SECTION("cut sequence")
    {
        transport.throwOnWrite = true;
        auto result = verifier.verify(transport, abandoned);
        REQUIRE(result.code == LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST);
        REQUIRE(result.message == "Connection lost after printing");
    }
}

TEST_CASE("PrintVerifierFactory: settle time grows over radio", "[print]")
{
    LabelPrintConfig config;
    REQUIRE(PrintVerifierFactory::createVerifier(PrinterFamily::SMART_PRINTER, config, true)->getName() == "smart");
    REQUIRE(PrintVerifierFactory::createVerifier(PrinterFamily::GENERIC_SOCKET_PRINTER, config, false)->getName() == "generic");
}
