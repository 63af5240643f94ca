#pragma once
#include "../events/event_system.h"
#include "device.h"
#include "discovery.h"
#include "print_job.h"
#include <vector>

namespace llink
{
    /**
     * Device list changed, carries the full registry snapshot
     */
    class DeviceListChangedEvent : public BaseEvent
    {
    public:
        std::vector<Device> devices;
        std::optional<std::string> selectedAddress;
    };

    /**
     * Discovery session created, updated or finalized
     */
    class DiscoverySessionEvent : public BaseEvent
    {
    public:
        DiscoverySession session;
    };

    /**
     * A discovery session ended in error
     */
    class DiscoveryErrorEvent : public BaseEvent
    {
    public:
        std::string sessionId;
        DiscoveryErrorKind kind = DiscoveryErrorKind::GENERAL;
        std::string message;
    };

    /**
     * Radio permission was refused, discovery did not start
     */
    class PermissionDeniedEvent : public BaseEvent
    {
    };

    /**
     * Connection state machine transition
     */
    class ConnectionStateEvent : public BaseEvent
    {
    public:
        ConnectionState state;
    };

    /**
     * Print job status transition
     */
    class PrintJobEvent : public BaseEvent
    {
    public:
        PrintJob job;
    };

} // namespace llink
