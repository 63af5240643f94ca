#include "discovery/network_discovery_source.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <unordered_set>

#include <sys/socket.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>

namespace llink
{
    // ========== LabelPrinterDiscoveryStrategy ==========

    std::string LabelPrinterDiscoveryStrategy::getDiscoveryMessage() const
    {
        static const char probe[] = {0x2e, 0x2c, 0x3a, 0x01, 0x00, 0x00};
        return std::string(probe, sizeof(probe));
    }

    std::string LabelPrinterDiscoveryStrategy::readField(const std::string &data, size_t offset, size_t size)
    {
        if (data.size() < offset)
        {
            return "";
        }
        std::string field = data.substr(offset, size);
        auto nul = field.find('\0');
        if (nul != std::string::npos)
        {
            field.resize(nul);
        }
        return StringUtils::trim(field);
    }

    std::unique_ptr<Device> LabelPrinterDiscoveryStrategy::parseResponse(const std::string &response,
                                                                         const std::string &senderIp,
                                                                         int senderPort) const
    {
        if (response.size() < HEADER_SIZE ||
            response[0] != 0x3a || response[1] != 0x2c || response[2] != 0x2e)
        {
            return nullptr;
        }
        if (!NetworkUtils::isValidIPAddress(senderIp))
        {
            return nullptr;
        }

        std::string systemName = readField(response, SYSTEM_NAME_OFFSET, SYSTEM_NAME_SIZE);
        std::string productName = readField(response, PRODUCT_NAME_OFFSET, PRODUCT_NAME_SIZE);

        auto device = std::make_unique<Device>();
        device->address = senderIp;
        if (!systemName.empty())
        {
            device->displayName = systemName;
        }
        else if (!productName.empty())
        {
            device->displayName = productName;
        }
        else
        {
            device->displayName = senderIp;
        }
        device->isWifi = true;
        device->statusText = statusSeverityToString(StatusSeverity::DISCONNECTED);
        device->statusSeverity = StatusSeverity::DISCONNECTED;

        LABEL_LOG_DEBUG("Parsed discovery reply from {}:{} ({})", senderIp, senderPort, device->displayName);
        return device;
    }

    // ========== NetworkDiscoverySource ==========

    NetworkDiscoverySource::NetworkDiscoverySource(const LabelDiscoveryConfig &config)
        : config_(config)
    {
        addDiscoveryStrategy(std::make_unique<LabelPrinterDiscoveryStrategy>(config_.networkProbePort));
    }

    NetworkDiscoverySource::~NetworkDiscoverySource()
    {
        stop();

        std::vector<std::shared_ptr<ProbeRun>> runs;
        {
            std::lock_guard<std::mutex> lock(runsMutex_);
            runs.swap(runs_);
        }
        // Probe threads end within one probe period
        for (auto &run : runs)
        {
            if (run->thread.joinable())
            {
                run->thread.join();
            }
        }
        LABEL_LOG_DEBUG("NetworkDiscoverySource destroyed");
    }

    void NetworkDiscoverySource::addDiscoveryStrategy(std::unique_ptr<INetworkDiscoveryStrategy> strategy)
    {
        if (strategy)
        {
            discoveryStrategies_.push_back(std::move(strategy));
        }
    }

    void NetworkDiscoverySource::start(const DiscoverySourceCallbacks &callbacks)
    {
        reapFinishedRuns();

        if (discoveryStrategies_.empty())
        {
            LABEL_LOG_ERROR("No network discovery strategies available");
            if (callbacks.onError)
            {
                callbacks.onError(DiscoveryErrorKind::GENERAL, "No network discovery strategies available");
            }
            return;
        }

        auto run = std::make_shared<ProbeRun>();
        {
            std::lock_guard<std::mutex> lock(runsMutex_);
            runs_.push_back(run);
            run->thread = std::thread(&NetworkDiscoverySource::probeThread, this, run, callbacks);
        }
        LABEL_LOG_INFO("Network discovery started with {} strategies", discoveryStrategies_.size());
    }

    void NetworkDiscoverySource::stop()
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        for (auto &run : runs_)
        {
            run->active = false;
        }
    }

    void NetworkDiscoverySource::reapFinishedRuns()
    {
        std::vector<std::shared_ptr<ProbeRun>> finished;
        {
            std::lock_guard<std::mutex> lock(runsMutex_);
            auto it = std::partition(runs_.begin(), runs_.end(),
                                     [](const std::shared_ptr<ProbeRun> &run)
                                     { return !run->done.load(); });
            finished.assign(it, runs_.end());
            runs_.erase(it, runs_.end());
        }
        for (auto &run : finished)
        {
            if (run->thread.joinable())
            {
                run->thread.join();
            }
        }
    }

    void NetworkDiscoverySource::probeThread(std::shared_ptr<ProbeRun> run, DiscoverySourceCallbacks callbacks)
    {
        int udpSocket = -1;
        auto fail = [&](const std::string &message)
        {
            LABEL_LOG_ERROR("Network discovery failed: {}", message);
            if (udpSocket >= 0)
            {
                close(udpSocket);
                udpSocket = -1;
            }
            if (run->active && callbacks.onError)
            {
                callbacks.onError(DiscoveryErrorKind::GENERAL, "Network discovery failed: " + message);
            }
            run->done = true;
        };

        try
        {
            udpSocket = socket(AF_INET, SOCK_DGRAM, 0);
            if (udpSocket < 0)
            {
                fail("cannot create UDP socket: " + getLastSocketError());
                return;
            }

            if (!NetworkUtils::enableBroadcast(udpSocket))
            {
                fail("cannot enable broadcast: " + getLastSocketError());
                return;
            }

            int optval = 1;
            if (setsockopt(udpSocket, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0)
            {
                LABEL_LOG_WARN("Failed to set SO_REUSEADDR: {}", getLastSocketError());
            }

            sockaddr_in listenAddr;
            memset(&listenAddr, 0, sizeof(listenAddr));
            listenAddr.sin_family = AF_INET;
            listenAddr.sin_addr.s_addr = INADDR_ANY;
            listenAddr.sin_port = htons(0);
            if (bind(udpSocket, reinterpret_cast<sockaddr *>(&listenAddr), sizeof(listenAddr)) != 0)
            {
                fail("cannot bind UDP socket: " + getLastSocketError());
                return;
            }

            if (!sendProbes(udpSocket))
            {
                LABEL_LOG_WARN("Discovery probe was not sent on any interface");
            }

            const auto deadline = std::chrono::steady_clock::now() +
                                  std::chrono::milliseconds(config_.networkProbePeriodMs);
            std::unordered_set<std::string> seen;
            char buffer[4096];

            while (run->active && std::chrono::steady_clock::now() < deadline)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     deadline - std::chrono::steady_clock::now())
                                     .count();
                long windowMs = std::max<long>(1, std::min<long>(remaining, config_.receiveWindowMs));

                fd_set readFds;
                FD_ZERO(&readFds);
                FD_SET(udpSocket, &readFds);
                timeval tv;
                tv.tv_sec = windowMs / 1000;
                tv.tv_usec = (windowMs % 1000) * 1000;

                int activity = select(udpSocket + 1, &readFds, nullptr, nullptr, &tv);
                if (activity < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    fail("select failed: " + getLastSocketError());
                    return;
                }
                if (activity == 0 || !FD_ISSET(udpSocket, &readFds))
                {
                    continue;
                }

                sockaddr_in senderAddr;
                socklen_t senderLen = sizeof(senderAddr);
                ssize_t bytesReceived = recvfrom(udpSocket, buffer, sizeof(buffer), 0,
                                                 reinterpret_cast<sockaddr *>(&senderAddr), &senderLen);
                if (bytesReceived <= 0)
                {
                    LABEL_LOG_DEBUG("recvfrom failed: {}", getLastSocketError());
                    continue;
                }

                char ipBuffer[INET_ADDRSTRLEN] = {0};
                inet_ntop(AF_INET, &senderAddr.sin_addr, ipBuffer, sizeof(ipBuffer));
                std::string senderIp = ipBuffer;
                int senderPort = ntohs(senderAddr.sin_port);
                std::string data(buffer, static_cast<size_t>(bytesReceived));

                for (const auto &strategy : discoveryStrategies_)
                {
                    auto device = strategy->parseResponse(data, senderIp, senderPort);
                    if (!device)
                    {
                        continue;
                    }
                    if (seen.insert(device->address).second && run->active && callbacks.onFound)
                    {
                        LABEL_LOG_INFO("Discovered network printer {} at {}",
                                       device->displayName, StringUtils::maskString(device->address));
                        callbacks.onFound(*device);
                    }
                    break;
                }
            }

            close(udpSocket);
            udpSocket = -1;
            LABEL_LOG_DEBUG("Network probe finished with {} replies", seen.size());

            if (run->active && callbacks.onFinished)
            {
                callbacks.onFinished();
            }
            run->done = true;
        }
        catch (const std::exception &e)
        {
            fail(e.what());
        }
    }

    bool NetworkDiscoverySource::sendProbes(int socketFd)
    {
        auto addresses = NetworkUtils::getBroadcastAddresses();
        std::vector<std::string> targets;
        for (const auto &info : addresses)
        {
            targets.push_back(info.broadcast);
        }
        if (targets.empty())
        {
            targets.push_back("255.255.255.255");
        }

        bool sentAny = false;
        for (const auto &strategy : discoveryStrategies_)
        {
            const std::string message = strategy->getDiscoveryMessage();
            for (const auto &target : targets)
            {
                sockaddr_in broadcastAddr;
                memset(&broadcastAddr, 0, sizeof(broadcastAddr));
                broadcastAddr.sin_family = AF_INET;
                broadcastAddr.sin_port = htons(static_cast<uint16_t>(strategy->getDefaultPort()));
                if (inet_pton(AF_INET, target.c_str(), &broadcastAddr.sin_addr) != 1)
                {
                    LABEL_LOG_WARN("Invalid broadcast address: {}", target);
                    continue;
                }

                ssize_t result = sendto(socketFd, message.data(), message.size(), 0,
                                        reinterpret_cast<sockaddr *>(&broadcastAddr), sizeof(broadcastAddr));
                if (result < 0)
                {
                    LABEL_LOG_ERROR("Failed to send probe to {}:{}, error: {}",
                                    target, strategy->getDefaultPort(), getLastSocketError());
                    continue;
                }
                LABEL_LOG_DEBUG("Discovery probe sent to {}:{}", target, strategy->getDefaultPort());
                sentAny = true;
            }
        }
        return sentAny;
    }

    std::string NetworkDiscoverySource::getLastSocketError()
    {
        return std::string(strerror(errno)) + " (" + std::to_string(errno) + ")";
    }
} // namespace llink
