#pragma once

#include <memory>
#include "config.h"
#include "platform/transport.h"

namespace llink
{
    /**
     * Routes addresses to transports: MAC addresses go to the platform radio factory,
     * IPv4 hosts get a TcpTransport on the family's port.
     */
    class DefaultTransportFactory : public ITransportFactory
    {
    public:
        DefaultTransportFactory(const LabelConnectionConfig &connectionConfig,
                                const LabelPrintConfig &printConfig,
                                std::shared_ptr<ITransportFactory> radioFactory);

        TransportPtr createTransport(const std::string &address, PrinterFamily family) override;

        int portForFamily(PrinterFamily family) const;

    private:
        LabelConnectionConfig connectionConfig_;
        LabelPrintConfig printConfig_;
        std::shared_ptr<ITransportFactory> radioFactory_;
    };
} // namespace llink
