#pragma once

#include <optional>
#include <string>
#include "types/biz.h"
#include "types/device.h"
#include "types/discovery.h"
#include "types/print_job.h"

namespace llink
{
    /**
     * Kind of an asynchronous notification entering the reconciler
     */
    enum class CoreEventType
    {
        PRINTER_FOUND,
        PRINTER_REMOVED,
        STATUS_CHANGED,
        CONNECTION_CHANGED,
        DISCOVERY_STARTED,
        DISCOVERY_DONE,
        DISCOVERY_ERROR,
        PERMISSION_DENIED,
        SYNC_REQUESTED,
        PRINT_STARTED,
        PRINT_COMPLETE,
        PRINT_ERROR,
        CANCEL_PRINT_JOBS,
    };

    /**
     * Tagged notification. Only the fields relevant to the type are set.
     */
    struct CoreEvent
    {
        CoreEventType type = CoreEventType::STATUS_CHANGED;

        Device device;                          // PRINTER_FOUND
        std::string address;                    // PRINTER_REMOVED
        std::string statusText;                 // STATUS_CHANGED
        StatusSeverity severity = StatusSeverity::DISCONNECTED;
        ConnectionState connection;             // CONNECTION_CHANGED
        DiscoverySession session;               // DISCOVERY_*
        PrintJob job;                           // PRINT_STARTED
        std::optional<std::string> jobId;       // PRINT_COMPLETE / PRINT_ERROR
        LLINK_ERROR_CODE errorCode = LLINK_ERROR_CODE::SUCCESS;
        std::string message;                    // PRINT_ERROR / CANCEL_PRINT_JOBS

        static CoreEvent printerFound(const Device &device)
        {
            CoreEvent event;
            event.type = CoreEventType::PRINTER_FOUND;
            event.device = device;
            return event;
        }

        static CoreEvent printerRemoved(const std::string &address)
        {
            CoreEvent event;
            event.type = CoreEventType::PRINTER_REMOVED;
            event.address = address;
            return event;
        }

        static CoreEvent statusChanged(const std::string &text, StatusSeverity severity)
        {
            CoreEvent event;
            event.type = CoreEventType::STATUS_CHANGED;
            event.statusText = text;
            event.severity = severity;
            return event;
        }

        static CoreEvent connectionChanged(const ConnectionState &state)
        {
            CoreEvent event;
            event.type = CoreEventType::CONNECTION_CHANGED;
            event.connection = state;
            return event;
        }

        static CoreEvent discovery(CoreEventType type, const DiscoverySession &session)
        {
            CoreEvent event;
            event.type = type;
            event.session = session;
            return event;
        }

        static CoreEvent permissionDenied()
        {
            CoreEvent event;
            event.type = CoreEventType::PERMISSION_DENIED;
            return event;
        }

        static CoreEvent syncRequested()
        {
            CoreEvent event;
            event.type = CoreEventType::SYNC_REQUESTED;
            return event;
        }

        static CoreEvent printStarted(const PrintJob &job)
        {
            CoreEvent event;
            event.type = CoreEventType::PRINT_STARTED;
            event.job = job;
            return event;
        }

        static CoreEvent printComplete(const std::optional<std::string> &jobId)
        {
            CoreEvent event;
            event.type = CoreEventType::PRINT_COMPLETE;
            event.jobId = jobId;
            return event;
        }

        static CoreEvent printError(const std::optional<std::string> &jobId, LLINK_ERROR_CODE code, const std::string &message)
        {
            CoreEvent event;
            event.type = CoreEventType::PRINT_ERROR;
            event.jobId = jobId;
            event.errorCode = code;
            event.message = message;
            return event;
        }

        static CoreEvent cancelPrintJobs(const std::string &reason)
        {
            CoreEvent event;
            event.type = CoreEventType::CANCEL_PRINT_JOBS;
            event.message = reason;
            return event;
        }
    };

    static std::string coreEventTypeToString(CoreEventType type)
    {
        switch (type)
        {
        case CoreEventType::PRINTER_FOUND:
            return "printerFound";
        case CoreEventType::PRINTER_REMOVED:
            return "printerRemoved";
        case CoreEventType::STATUS_CHANGED:
            return "statusChanged";
        case CoreEventType::CONNECTION_CHANGED:
            return "connectionChanged";
        case CoreEventType::DISCOVERY_STARTED:
            return "discoveryStarted";
        case CoreEventType::DISCOVERY_DONE:
            return "discoveryDone";
        case CoreEventType::DISCOVERY_ERROR:
            return "discoveryError";
        case CoreEventType::PERMISSION_DENIED:
            return "permissionDenied";
        case CoreEventType::SYNC_REQUESTED:
            return "syncRequested";
        case CoreEventType::PRINT_STARTED:
            return "printStarted";
        case CoreEventType::PRINT_COMPLETE:
            return "printComplete";
        case CoreEventType::PRINT_ERROR:
            return "printError";
        case CoreEventType::CANCEL_PRINT_JOBS:
            return "cancelPrintJobs";
        default:
            return "unknown";
        }
    }
} // namespace llink
