#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.h"
#include "label_export.h"
#include "events/event_system.h"
#include "platform/discovery_source.h"
#include "platform/last_device_store.h"
#include "platform/radio_scanner.h"
#include "platform/transport.h"
#include "types/event.h"

namespace llink
{
    /**
     * Platform collaborators handed to LabelLink::initialize.
     * Everything is optional; missing pieces disable the matching feature.
     */
    struct PlatformBindings
    {
        // Replaces the built-in address routing entirely
        std::shared_ptr<ITransportFactory> transportFactory;
        // Radio (MAC address) transports for the built-in routing
        std::shared_ptr<ITransportFactory> radioTransportFactory;
        // Enables the radio discovery source
        std::shared_ptr<IRadioScanner> radioScanner;
        // When non-empty, replaces the built-in radio and network sources
        std::vector<DiscoverySourcePtr> discoverySources;
        // Defaults to a process-local store
        std::shared_ptr<ILastDeviceStore> lastDeviceStore;
    };

    /**
     * LabelLink - label printer discovery, connection and printing
     *
     * Discovers printers over the short-range radio and the local network, keeps a
     * single exclusive connection and prints to it. Every operation is bounded by a
     * timeout. State changes are published on the EventBus as
     * DeviceListChangedEvent, DiscoverySessionEvent, DiscoveryErrorEvent,
     * PermissionDeniedEvent, ConnectionStateEvent and PrintJobEvent.
     *
     * Calls before initialize() return NOT_INITIALIZED, calls after dispose() return DISPOSED.
     */
    class LABEL_LINK_API LabelLink
    {
    public:
        using Config = LabelLinkConfig;
        using EventSubscriptionId = EventBus::EventId;

        LabelLink();
        ~LabelLink();

        LabelLink(const LabelLink &) = delete;
        LabelLink &operator=(const LabelLink &) = delete;

        // ========== Lifecycle ==========

        VoidResult initialize(const Config &config = Config(), const PlatformBindings &platform = PlatformBindings());

        /**
         * Stop discovery, cancel in-flight jobs and disconnect. Final.
         */
        void dispose();

        bool isInitialized() const;
        bool isDisposed() const;

        // ========== Discovery ==========

        /**
         * Start a discovery session
         * @return the SCANNING session, DISCOVERY_ALREADY_RUNNING or PERMISSION_DENIED
         */
        BizResult<DiscoverySession> startDiscovery();

        /**
         * End the active session. No-op without one.
         */
        VoidResult stopDiscovery();

        std::optional<DiscoverySession> getCurrentSession() const;

        // ========== Connection ==========

        /**
         * Connect to a printer. Connecting to the connected printer disconnects it.
         * @param family Defaults to SMART_PRINTER
         */
        VoidResult connect(const std::string &address, std::optional<PrinterFamily> family = std::nullopt);

        VoidResult disconnect();

        /**
         * Probe the connected printer
         */
        bool isConnected();

        ConnectionState getConnectionState() const;

        std::future<VoidResult> connectAsync(const std::string &address, std::optional<PrinterFamily> family = std::nullopt);
        std::future<VoidResult> disconnectAsync();

        // ========== Printing ==========

        /**
         * Print a payload (1 to 65536 bytes) and wait for the outcome
         * @return the terminal job; on failure the code carries the failure kind
         */
        BizResult<PrintJob> print(const std::string &payload, const std::optional<std::string> &jobId = std::nullopt);

        std::future<BizResult<PrintJob>> printAsync(const std::string &payload,
                                                    const std::optional<std::string> &jobId = std::nullopt);

        /**
         * Send media, darkness and calibration commands through the print path
         */
        VoidResult configure(std::optional<MediaType> mediaType, std::optional<int> darkness, bool calibrate = false);

        /**
         * Switch between normal and inverted print orientation
         * @return true when inverted
         */
        bool toggleRotation();
        bool isRotated() const;

        // ========== Devices and jobs ==========

        std::vector<Device> getDevices() const;

        /**
         * @return PRINTER_NOT_FOUND if the address is not registered
         */
        VoidResult removePrinter(const std::string &address);

        VoidResult clearPrinters();

        std::vector<PrintJob> getPrintJobs() const;
        std::optional<PrintJob> getPrintJob(const std::string &jobId) const;

        // ========== Last device ==========

        VoidResult saveLastDevice(const LastDevice &device);

        /**
         * @return PRINTER_NOT_FOUND if nothing is stored
         */
        BizResult<LastDevice> loadLastDevice();

        VoidResult clearLastDevice();

        // ========== Events ==========

        std::shared_ptr<EventBus> getEventBus() const { return eventBus_; }

        template <typename EventType>
        EventSubscriptionId subscribeEvent(std::function<void(const std::shared_ptr<EventType> &)> handler)
        {
            return eventBus_->subscribe<EventType>(std::move(handler));
        }

        template <typename EventType>
        bool unsubscribeEvent(EventSubscriptionId id)
        {
            return eventBus_->unsubscribe<EventType>(id);
        }

    private:
        class Impl;
        std::shared_ptr<EventBus> eventBus_;
        std::unique_ptr<Impl> pImpl_;
    };
} // namespace llink
