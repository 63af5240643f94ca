#pragma once

#include <memory>
#include <optional>
#include <string>
#include "types/biz.h"
#include "types/device.h"

namespace llink
{
    /**
     * Byte stream to one printer.
     * Implementations must tolerate close() racing with a blocked open/write/queryStatus
     * from another thread; close() makes the blocked call fail promptly.
     */
    class ITransport
    {
    public:
        virtual ~ITransport() = default;

        /**
         * Open the channel. Blocks until connected or failed.
         */
        virtual VoidResult open() = 0;

        /**
         * Close the channel. Idempotent.
         */
        virtual void close() = 0;

        /**
         * Write all bytes
         */
        virtual VoidResult write(const std::string &bytes) = 0;

        /**
         * Whether the channel still reports itself open
         */
        virtual bool isOpen() const = 0;

        /**
         * Query printer status flags.
         * @return std::nullopt when the transport has no telemetry or the query failed
         */
        virtual std::optional<PrinterStatusFlags> queryStatus() = 0;

        /**
         * Transport type name, e.g. "tcp" or "radio"
         */
        virtual std::string getTransportType() const = 0;
    };

    using TransportPtr = std::shared_ptr<ITransport>;

    /**
     * Creates unopened transports for an address and printer family
     */
    class ITransportFactory
    {
    public:
        virtual ~ITransportFactory() = default;

        /**
         * @return nullptr if no transport is available for the address
         */
        virtual TransportPtr createTransport(const std::string &address, PrinterFamily family) = 0;
    };

} // namespace llink
