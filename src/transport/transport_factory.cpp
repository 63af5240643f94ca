#include "transport/transport_factory.h"
#include "transport/tcp_transport.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace llink
{
    DefaultTransportFactory::DefaultTransportFactory(const LabelConnectionConfig &connectionConfig,
                                                     const LabelPrintConfig &printConfig,
                                                     std::shared_ptr<ITransportFactory> radioFactory)
        : connectionConfig_(connectionConfig), printConfig_(printConfig), radioFactory_(std::move(radioFactory))
    {
    }

    int DefaultTransportFactory::portForFamily(PrinterFamily family) const
    {
        return family == PrinterFamily::SMART_PRINTER ? connectionConfig_.smartPrinterPort
                                                      : connectionConfig_.genericPrinterPort;
    }

    TransportPtr DefaultTransportFactory::createTransport(const std::string &address, PrinterFamily family)
    {
        if (isRadioAddress(address))
        {
            if (!radioFactory_)
            {
                LABEL_LOG_WARN("No radio transport available for {}", StringUtils::maskString(address));
                return nullptr;
            }
            return radioFactory_->createTransport(address, family);
        }

        TcpTransportOptions options;
        options.connectTimeoutMs = connectionConfig_.timeoutMs;
        options.ioTimeoutMs = connectionConfig_.socketIoTimeoutMs;
        options.statusQueryTimeoutMs = printConfig_.statusQueryTimeoutMs;
        options.enableStatusQuery = family == PrinterFamily::SMART_PRINTER;
        return std::make_shared<TcpTransport>(address, portForFamily(family), options);
    }
} // namespace llink
