#pragma once
#include "device.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
namespace llink
{
    enum class DiscoveryStatus
    {
        IDLE,
        SCANNING,
        COMPLETED,
        ERROR_STATE,
    };

    /**
     * Distinguishes failures callers handle differently
     */
    enum class DiscoveryErrorKind
    {
        NONE = 0,
        GENERAL = -1,           // Generic source failure
        RADIO_DISABLED = -2,    // Radio adapter switched off
        LOCATION_DISABLED = -3, // Location service off, radio scan impossible
    };

    /**
     * One logical discovery run
     */
    struct DiscoverySession
    {
        std::string id;
        DiscoveryStatus status = DiscoveryStatus::IDLE;
        std::vector<Device> devices; // Registry snapshot
        std::chrono::system_clock::time_point startedAt;
        std::optional<std::chrono::system_clock::time_point> completedAt;
        std::optional<std::string> errorMessage;
        DiscoveryErrorKind errorKind = DiscoveryErrorKind::NONE;

        bool isTerminal() const
        {
            return status == DiscoveryStatus::COMPLETED || status == DiscoveryStatus::ERROR_STATE;
        }
    };

    static std::string discoveryStatusToString(DiscoveryStatus status)
    {
        switch (status)
        {
        case DiscoveryStatus::IDLE:
            return "Idle";
        case DiscoveryStatus::SCANNING:
            return "Scanning";
        case DiscoveryStatus::COMPLETED:
            return "Completed";
        case DiscoveryStatus::ERROR_STATE:
            return "Error";
        default:
            return "Unknown";
        }
    }
} // namespace llink
