#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include "platform/discovery_source.h"
#include "platform/radio_scanner.h"

namespace llink
{
    /**
     * Discovery source backed by the platform radio scanner.
     *
     * The scan never finishes by itself; the coordinator ends it through stop()
     * or its global timeout. Devices seen in earlier runs are replayed when a new
     * run starts.
     */
    class RadioDiscoverySource : public IDiscoverySource
    {
    public:
        static constexpr const char *RADIO_DISABLED_MESSAGE = "Bluetooth radio is currently disabled";
        static constexpr const char *LOCATION_DISABLED_MESSAGE = "Your location service is off.";

        explicit RadioDiscoverySource(std::shared_ptr<IRadioScanner> scanner);
        ~RadioDiscoverySource() override;

        std::string getName() const override { return "radio"; }
        VoidResult checkPermission() override;
        void start(const DiscoverySourceCallbacks &callbacks) override;
        void stop() override;
        bool isStoppable() const override { return true; }

        /**
         * Map a scanner error text to its error kind
         */
        static DiscoveryErrorKind classifyError(const std::string &message);

    private:
        // Owned jointly with the scanner callbacks
        struct ScanState
        {
            // Incremented on every start/stop; scanner callbacks from older runs are dropped
            std::atomic<uint64_t> generation{0};
            std::atomic<bool> scanning{false};

            std::mutex knownMutex;
            std::map<std::string, Device> knownDevices;
        };

        static Device makeDevice(const std::string &address, const std::string &name);

        std::shared_ptr<IRadioScanner> scanner_;
        std::shared_ptr<ScanState> state_;
    };
} // namespace llink
