#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "config.h"
#include "core/core_event.h"
#include "platform/discovery_source.h"
#include "platform/last_device_store.h"
#include "platform/radio_scanner.h"
#include "platform/transport.h"

namespace llink
{
namespace test
{
    /**
     * Poll until the predicate holds or the timeout passes
     */
    inline bool waitUntil(const std::function<bool()> &predicate, int timeoutMs = 2000)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    inline PrinterStatusFlags readyStatus()
    {
        PrinterStatusFlags flags;
        flags.isReadyToPrint = true;
        return flags;
    }

    /**
     * Scriptable in-memory transport
     */
    class FakeTransport : public ITransport
    {
    public:
        explicit FakeTransport(std::string type = "fake") : type_(std::move(type)) {}

        VoidResult open() override
        {
            ++openCalls;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = false;
            }
            if (openDelayMs > 0)
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, std::chrono::milliseconds(openDelayMs), [this]
                             { return closed_; });
                if (closed_)
                {
                    return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR, "closed while opening");
                }
            }
            std::lock_guard<std::mutex> lock(mutex_);
            if (!openResult.isSuccess())
            {
                return openResult;
            }
            open_ = true;
            return VoidResult::Success();
        }

        void close() override
        {
            ++closeCalls;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                open_ = false;
                closed_ = true;
            }
            cv_.notify_all();
        }

        VoidResult write(const std::string &bytes) override
        {
            if (throwOnWrite)
            {
                throw std::runtime_error("radio link dropped");
            }
            if (writeDelayMs > 0)
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, std::chrono::milliseconds(writeDelayMs), [this]
                             { return closed_; });
            }
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_)
            {
                return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, "socket closed");
            }
            if (!writeResult.isSuccess())
            {
                return writeResult;
            }
            writes.push_back(bytes);
            return VoidResult::Success();
        }

        bool isOpen() const override
        {
            if (throwOnIsOpen)
            {
                throw std::runtime_error("socket state unavailable");
            }
            std::lock_guard<std::mutex> lock(mutex_);
            return open_;
        }

        std::optional<PrinterStatusFlags> queryStatus() override
        {
            ++statusQueries;
            if (throwOnStatus)
            {
                throw std::runtime_error("status channel unavailable");
            }
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_)
            {
                return std::nullopt;
            }
            return status;
        }

        std::string getTransportType() const override { return type_; }

        void dropConnection()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
        }

        std::vector<std::string> writtenData() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return writes;
        }

        // Script, set before use
        VoidResult openResult = VoidResult::Success();
        VoidResult writeResult = VoidResult::Success();
        std::optional<PrinterStatusFlags> status = readyStatus();
        int openDelayMs = 0;
        int writeDelayMs = 0;
        std::atomic<bool> throwOnWrite{false};
        std::atomic<bool> throwOnStatus{false};
        std::atomic<bool> throwOnIsOpen{false};

        std::atomic<int> openCalls{0};
        std::atomic<int> closeCalls{0};
        std::atomic<int> statusQueries{0};

    private:
        std::string type_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool open_ = false;
        bool closed_ = false;
        std::vector<std::string> writes;
    };

    /**
     * Hands out a FakeTransport per address, creating one on first use
     */
    class FakeTransportFactory : public ITransportFactory
    {
    public:
        TransportPtr createTransport(const std::string &address, PrinterFamily family) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++created;
            lastFamily = family;
            if (unavailable.count(address) > 0)
            {
                return nullptr;
            }
            auto it = transports_.find(address);
            if (it == transports_.end())
            {
                it = transports_.emplace(address, std::make_shared<FakeTransport>()).first;
            }
            return it->second;
        }

        std::shared_ptr<FakeTransport> transportFor(const std::string &address)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = transports_.find(address);
            if (it == transports_.end())
            {
                it = transports_.emplace(address, std::make_shared<FakeTransport>()).first;
            }
            return it->second;
        }

        std::map<std::string, bool> unavailable;
        std::atomic<int> created{0};
        std::atomic<PrinterFamily> lastFamily{PrinterFamily::SMART_PRINTER};

    private:
        std::mutex mutex_;
        std::map<std::string, std::shared_ptr<FakeTransport>> transports_;
    };

    /**
     * Discovery source driven by the test through the captured callbacks
     */
    class FakeDiscoverySource : public IDiscoverySource
    {
    public:
        explicit FakeDiscoverySource(std::string name = "fake") : name_(std::move(name)) {}

        std::string getName() const override { return name_; }

        VoidResult checkPermission() override { return permission; }

        void start(const DiscoverySourceCallbacks &callbacks) override
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                callbacks_ = callbacks;
            }
            ++startCalls;
            if (onStart)
            {
                onStart(callbacks);
            }
        }

        void stop() override { ++stopCalls; }

        bool isStoppable() const override { return true; }

        DiscoverySourceCallbacks callbacks() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return callbacks_;
        }

        void found(const Device &device) const
        {
            auto cb = callbacks();
            if (cb.onFound)
            {
                cb.onFound(device);
            }
        }

        void gone(const Device &device) const
        {
            auto cb = callbacks();
            if (cb.onGone)
            {
                cb.onGone(device);
            }
        }

        void finish() const
        {
            auto cb = callbacks();
            if (cb.onFinished)
            {
                cb.onFinished();
            }
        }

        void fail(DiscoveryErrorKind kind, const std::string &message) const
        {
            auto cb = callbacks();
            if (cb.onError)
            {
                cb.onError(kind, message);
            }
        }

        VoidResult permission = VoidResult::Success();
        std::function<void(const DiscoverySourceCallbacks &)> onStart;
        std::atomic<int> startCalls{0};
        std::atomic<int> stopCalls{0};

    private:
        std::string name_;
        mutable std::mutex mutex_;
        DiscoverySourceCallbacks callbacks_;
    };

    class FakeRadioScanner : public IRadioScanner
    {
    public:
        RadioPermission checkPermission() override { return permission; }

        bool requestPermission() override
        {
            ++permissionRequests;
            if (grantOnRequest)
            {
                permission = RadioPermission::GRANTED;
            }
            return grantOnRequest;
        }

        bool isRadioEnabled() override { return radioEnabled; }

        bool startScan(const RadioScanCallbacks &callbacks) override
        {
            ++scanStarts;
            if (!scanStartSucceeds)
            {
                return false;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks_ = callbacks;
            return true;
        }

        void cancelScan() override { ++scanCancels; }

        RadioScanCallbacks callbacks() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return callbacks_;
        }

        std::atomic<RadioPermission> permission{RadioPermission::GRANTED};
        std::atomic<bool> grantOnRequest{false};
        std::atomic<bool> radioEnabled{true};
        std::atomic<bool> scanStartSucceeds{true};
        std::atomic<int> permissionRequests{0};
        std::atomic<int> scanStarts{0};
        std::atomic<int> scanCancels{0};

    private:
        mutable std::mutex mutex_;
        RadioScanCallbacks callbacks_;
    };

    class FakeLastDeviceStore : public ILastDeviceStore
    {
    public:
        std::optional<std::string> load(const std::string &key) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = values.find(key);
            if (it == values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        bool save(const std::string &key, const std::string &value) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (rejectWrites)
            {
                return false;
            }
            values[key] = value;
            return true;
        }

        bool remove(const std::string &key) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return values.erase(key) > 0;
        }

        std::map<std::string, std::string> values;
        bool rejectWrites = false;

    private:
        std::mutex mutex_;
    };

    /**
     * Collects core events posted by a component
     */
    class CoreEventRecorder
    {
    public:
        std::function<bool(CoreEvent)> sink()
        {
            return [this](CoreEvent event)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                events_.push_back(std::move(event));
                return true;
            };
        }

        std::vector<CoreEvent> events() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_;
        }

        std::vector<CoreEventType> types() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<CoreEventType> result;
            for (const auto &event : events_)
            {
                result.push_back(event.type);
            }
            return result;
        }

        size_t count(CoreEventType type) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t n = 0;
            for (const auto &event : events_)
            {
                if (event.type == type)
                {
                    ++n;
                }
            }
            return n;
        }

        std::vector<ConnectionPhase> phases() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<ConnectionPhase> result;
            for (const auto &event : events_)
            {
                if (event.type == CoreEventType::CONNECTION_CHANGED)
                {
                    result.push_back(event.connection.phase);
                }
            }
            return result;
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.clear();
        }

    private:
        mutable std::mutex mutex_;
        std::vector<CoreEvent> events_;
    };

    inline Device makeDevice(const std::string &address, const std::string &name, bool isWifi = false)
    {
        Device device;
        device.address = address;
        device.displayName = name;
        device.isWifi = isWifi;
        device.statusText = "Disconnected";
        return device;
    }

    /**
     * Config with short waits so tests run fast
     */
    inline LabelLinkConfig fastConfig()
    {
        LabelLinkConfig config;
        config.log.logLevel = 4;
        config.discovery.timeoutMs = 2000;
        config.connection.timeoutMs = 1000;
        config.connection.settleDelayMs = 10;
        config.print.timeoutMs = 1000;
        config.print.smartSettleMs = 10;
        config.print.radioExtraSettleMs = 0;
        config.print.genericSettleMs = 10;
        return config;
    }
} // namespace test
} // namespace llink
