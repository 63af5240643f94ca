#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "config.h"
#include "platform/discovery_source.h"

namespace llink
{
    /**
     * Network Discovery Strategy Interface
     * Builds the probe and recognizes replies of one printer protocol
     */
    class INetworkDiscoveryStrategy
    {
    public:
        virtual ~INetworkDiscoveryStrategy() = default;
        virtual std::string getName() const = 0;
        virtual std::string getDiscoveryMessage() const = 0;
        virtual int getDefaultPort() const = 0;

        /**
         * @return the device described by the reply, nullptr if the reply is not recognized
         */
        virtual std::unique_ptr<Device> parseResponse(const std::string &response,
                                                      const std::string &senderIp,
                                                      int senderPort) const = 0;
    };

    /**
     * Label printer UDP discovery (direct broadcast advisory protocol)
     *
     * Probe: 2E 2C 3A 01 00 00
     * Reply: header 3A 2C 2E, product name at PRODUCT_NAME_OFFSET,
     *        system name at SYSTEM_NAME_OFFSET, both NUL padded.
     */
    class LabelPrinterDiscoveryStrategy : public INetworkDiscoveryStrategy
    {
    public:
        static constexpr size_t HEADER_SIZE = 3;
        static constexpr size_t PRODUCT_NAME_OFFSET = 4;
        static constexpr size_t PRODUCT_NAME_SIZE = 20;
        static constexpr size_t SYSTEM_NAME_OFFSET = 63;
        static constexpr size_t SYSTEM_NAME_SIZE = 25;

        explicit LabelPrinterDiscoveryStrategy(int port) : port_(port) {}

        std::string getName() const override { return "label-printer-advisory"; }
        std::string getDiscoveryMessage() const override;
        int getDefaultPort() const override { return port_; }
        std::unique_ptr<Device> parseResponse(const std::string &response,
                                              const std::string &senderIp,
                                              int senderPort) const override;

    private:
        static std::string readField(const std::string &data, size_t offset, size_t size);

        int port_;
    };

    /**
     * Discovery source that broadcasts UDP probes on every IPv4 interface.
     *
     * Each start() runs on its own thread for a bounded probe period and then reports
     * finished. The probe cannot be cancelled mid-flight: stop() only marks the running
     * probes inactive so that they stop reporting.
     */
    class NetworkDiscoverySource : public IDiscoverySource
    {
    public:
        explicit NetworkDiscoverySource(const LabelDiscoveryConfig &config);
        ~NetworkDiscoverySource() override;

        void addDiscoveryStrategy(std::unique_ptr<INetworkDiscoveryStrategy> strategy);

        std::string getName() const override { return "network"; }
        void start(const DiscoverySourceCallbacks &callbacks) override;
        void stop() override;
        bool isStoppable() const override { return false; }

    private:
        struct ProbeRun
        {
            std::atomic<bool> active{true};
            std::atomic<bool> done{false};
            std::thread thread;
        };

        void probeThread(std::shared_ptr<ProbeRun> run, DiscoverySourceCallbacks callbacks);
        bool sendProbes(int socketFd);
        void reapFinishedRuns();
        static std::string getLastSocketError();

        LabelDiscoveryConfig config_;
        std::vector<std::unique_ptr<INetworkDiscoveryStrategy>> discoveryStrategies_;

        std::mutex runsMutex_;
        std::vector<std::shared_ptr<ProbeRun>> runs_;
    };
} // namespace llink
