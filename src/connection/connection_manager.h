#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "config.h"
#include "core/core_event.h"
#include "platform/transport.h"
#include "utils/thread_pool.h"

namespace llink
{
    /**
     * Exclusive use of the connected transport.
     * Must be released on the thread that acquired it.
     */
    struct TransportLease
    {
        std::unique_lock<std::mutex> lock;
        TransportPtr transport;
        ConnectionState state;
    };

    /**
     * Connection Manager
     *
     * Owns the single connection slot and drives
     * DISCONNECTED -> CONNECTING -> CONNECTED -> DISCONNECTING -> DISCONNECTED.
     * Every phase change is posted as a CONNECTION_CHANGED core event.
     */
    class ConnectionManager
    {
    public:
        using EventSink = std::function<bool(CoreEvent)>;

        static constexpr size_t MAX_ADDRESS_LENGTH = 255;

        ConnectionManager(const LabelConnectionConfig &config,
                          std::shared_ptr<ITransportFactory> transportFactory,
                          ThreadPool &ioPool,
                          EventSink sink);
        ~ConnectionManager();

        ConnectionManager(const ConnectionManager &) = delete;
        ConnectionManager &operator=(const ConnectionManager &) = delete;

        /**
         * Connect to a printer. Connecting to the current address disconnects instead.
         * @return OPERATION_IN_PROGRESS, INVALID_PARAMETER, PRINTER_CONNECTION_ERROR or OPERATION_TIMEOUT on failure
         */
        VoidResult connect(const std::string &address, PrinterFamily family);

        /**
         * Idempotent. Cancels an in-flight connect.
         */
        VoidResult disconnect();

        /**
         * Probe the transport. A failed probe moves the state to DISCONNECTED.
         */
        bool isConnected();

        ConnectionState getState() const;

        /**
         * @return a lease on the transport, std::nullopt unless CONNECTED
         */
        std::optional<TransportLease> acquireLease();

        /**
         * Tear the connection down if `transport` is still the active one.
         * Must not be called while holding a lease.
         */
        void handleTransportFailure(const TransportPtr &transport, const std::string &reason);

        /**
         * Close `transport` immediately and tear it down in the background.
         * Used when an operation on it timed out.
         */
        void abortTransport(const TransportPtr &transport, const std::string &reason);

        static VoidResult validateAddress(const std::string &address);

    private:
        /**
         * @return true if there was a connection to tear down
         */
        bool teardown(const std::string &reason);

        void setStateLocked(const ConnectionState &state);

        ConnectionState disconnectedState() const;

        LabelConnectionConfig config_;
        std::shared_ptr<ITransportFactory> transportFactory_;
        ThreadPool &ioPool_;
        EventSink sink_;

        std::atomic<bool> isConnecting_{false};

        // Held by whoever uses or replaces transport_
        std::mutex leaseMutex_;

        mutable std::mutex stateMutex_;
        ConnectionState state_;
        TransportPtr transport_;
        TransportPtr pendingTransport_;
        uint64_t connectGeneration_ = 0;
    };
} // namespace llink
