#pragma once
#include "biz.h"
#include <chrono>
#include <optional>
#include <string>
namespace llink
{
    enum class PrintJobStatus
    {
        QUEUED,
        PRINTING,
        COMPLETED,
        FAILED,
        CANCELLED,
    };

    /**
     * A print request and its outcome. Immutable once terminal.
     */
    struct PrintJob
    {
        std::string id;
        std::string payload;
        PrintJobStatus status = PrintJobStatus::QUEUED;
        std::chrono::system_clock::time_point createdAt;
        std::optional<std::chrono::system_clock::time_point> completedAt;
        std::optional<std::string> errorMessage;
        LLINK_ERROR_CODE errorCode = LLINK_ERROR_CODE::SUCCESS;

        bool isTerminal() const
        {
            return status == PrintJobStatus::COMPLETED || status == PrintJobStatus::FAILED ||
                   status == PrintJobStatus::CANCELLED;
        }
    };

    static std::string printJobStatusToString(PrintJobStatus status)
    {
        switch (status)
        {
        case PrintJobStatus::QUEUED:
            return "Queued";
        case PrintJobStatus::PRINTING:
            return "Printing";
        case PrintJobStatus::COMPLETED:
            return "Completed";
        case PrintJobStatus::FAILED:
            return "Failed";
        case PrintJobStatus::CANCELLED:
            return "Cancelled";
        default:
            return "Unknown";
        }
    }
} // namespace llink
