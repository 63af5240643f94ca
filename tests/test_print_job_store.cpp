#include <catch2/catch.hpp>
#include "core/print_job_store.h"

using namespace llink;

namespace
{
    PrintJob makeJob(const std::string &id)
    {
        PrintJob job;
        job.id = id;
        job.payload = "^XA^FDHello^XZ";
        job.createdAt = std::chrono::system_clock::now();
        return job;
    }
}

TEST_CASE("PrintJobStore: lifecycle", "[print_jobs]")
{
    PrintJobStore store;
    REQUIRE(store.add(makeJob("job-1")));
    REQUIRE_FALSE(store.add(makeJob("job-1")));
    REQUIRE(store.get("job-1")->status == PrintJobStatus::QUEUED);

    REQUIRE(store.markPrinting("job-1")->status == PrintJobStatus::PRINTING);
    REQUIRE_FALSE(store.markPrinting("job-1").has_value());

    SECTION("success completes the job")
    {
        auto job = store.resolve(std::string("job-1"), LLINK_ERROR_CODE::SUCCESS, "");
        REQUIRE(job.has_value());
        REQUIRE(job->status == PrintJobStatus::COMPLETED);
        REQUIRE(job->completedAt.has_value());
        REQUIRE_FALSE(job->errorMessage.has_value());
    }

    SECTION("failure records the reason")
    {
        auto job = store.resolve(std::string("job-1"), LLINK_ERROR_CODE::PRINT_FAULT_PAPER_OUT, "Paper out");
        REQUIRE(job->status == PrintJobStatus::FAILED);
        REQUIRE(job->errorMessage == std::string("Paper out"));
        REQUIRE(job->errorCode == LLINK_ERROR_CODE::PRINT_FAULT_PAPER_OUT);
    }

    SECTION("terminal jobs are not resolved again")
    {
        store.resolve(std::string("job-1"), LLINK_ERROR_CODE::SUCCESS, "");
        REQUIRE_FALSE(store.resolve(std::string("job-1"), LLINK_ERROR_CODE::UNKNOWN_ERROR, "late").has_value());
        REQUIRE(store.get("job-1")->status == PrintJobStatus::COMPLETED);
    }
}

TEST_CASE("PrintJobStore: resolve without an id targets the latest printing job", "[print_jobs]")
{
    PrintJobStore store;
    store.add(makeJob("first"));
    store.markPrinting("first");
    store.add(makeJob("second"));
    store.markPrinting("second");

    auto job = store.resolve(std::nullopt, LLINK_ERROR_CODE::SUCCESS, "");
    REQUIRE(job->id == "second");
    REQUIRE(store.get("first")->status == PrintJobStatus::PRINTING);
}

TEST_CASE("PrintJobStore: cancelActive leaves terminal jobs alone", "[print_jobs]")
{
    PrintJobStore store;
    store.add(makeJob("done"));
    store.markPrinting("done");
    store.resolve(std::string("done"), LLINK_ERROR_CODE::SUCCESS, "");
    store.add(makeJob("queued"));
    store.add(makeJob("printing"));
    store.markPrinting("printing");

    auto cancelled = store.cancelActive("disposed");
    REQUIRE(cancelled.size() == 2);
    REQUIRE(store.get("done")->status == PrintJobStatus::COMPLETED);
    REQUIRE(store.get("queued")->status == PrintJobStatus::CANCELLED);
    REQUIRE(store.get("printing")->errorMessage == std::string("disposed"));

    auto all = store.getAll();
    REQUIRE(all.size() == 3);
    REQUIRE(all.front().id == "done");
}
