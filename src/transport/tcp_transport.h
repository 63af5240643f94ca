#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include "platform/transport.h"

namespace llink
{
    struct TcpTransportOptions
    {
        int connectTimeoutMs = 30000;
        int ioTimeoutMs = 5000;
        int statusQueryTimeoutMs = 3000;
        bool enableStatusQuery = true; // ~HS host status, smart printers only
    };

    /**
     * POSIX TCP transport to a network printer
     */
    class TcpTransport : public ITransport
    {
    public:
        TcpTransport(std::string host, int port, TcpTransportOptions options = TcpTransportOptions());
        ~TcpTransport() override;

        TcpTransport(const TcpTransport &) = delete;
        TcpTransport &operator=(const TcpTransport &) = delete;

        VoidResult open() override;
        void close() override;
        VoidResult write(const std::string &bytes) override;
        bool isOpen() const override;
        std::optional<PrinterStatusFlags> queryStatus() override;
        std::string getTransportType() const override { return "tcp"; }

        const std::string &getHost() const { return host_; }
        int getPort() const { return port_; }

    private:
        VoidResult sendAllLocked(int fd, const std::string &bytes);
        std::string describeEndpoint() const;

        std::string host_;
        int port_;
        TcpTransportOptions options_;

        std::atomic<int> socket_{-1};
        std::atomic<bool> closed_{false};
        mutable std::mutex ioMutex_;
    };
} // namespace llink
