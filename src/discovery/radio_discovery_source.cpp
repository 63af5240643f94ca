#include "discovery/radio_discovery_source.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace llink
{
    RadioDiscoverySource::RadioDiscoverySource(std::shared_ptr<IRadioScanner> scanner)
        : scanner_(std::move(scanner)), state_(std::make_shared<ScanState>())
    {
    }

    RadioDiscoverySource::~RadioDiscoverySource()
    {
        stop();
    }

    VoidResult RadioDiscoverySource::checkPermission()
    {
        if (!scanner_)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::DISCOVERY_FAILED, "No radio scanner available");
        }

        if (scanner_->checkPermission() != RadioPermission::DENIED)
        {
            return VoidResult::Success();
        }

        LABEL_LOG_INFO("Radio scan permission missing, requesting it");
        if (scanner_->requestPermission())
        {
            return VoidResult::Success();
        }

        LABEL_LOG_WARN("Radio scan permission denied");
        return VoidResult::Error(LLINK_ERROR_CODE::PERMISSION_DENIED, "Radio scan permission denied");
    }

    DiscoveryErrorKind RadioDiscoverySource::classifyError(const std::string &message)
    {
        if (StringUtils::containsIgnoreCase(message, "radio is currently disabled"))
        {
            return DiscoveryErrorKind::RADIO_DISABLED;
        }
        return DiscoveryErrorKind::GENERAL;
    }

    Device RadioDiscoverySource::makeDevice(const std::string &address, const std::string &name)
    {
        Device device;
        device.address = address;
        device.displayName = name.empty() ? address : name;
        device.isWifi = false;
        device.statusText = statusSeverityToString(StatusSeverity::DISCONNECTED);
        device.statusSeverity = StatusSeverity::DISCONNECTED;
        device.isConnected = false;
        return device;
    }

    void RadioDiscoverySource::start(const DiscoverySourceCallbacks &callbacks)
    {
        if (!scanner_)
        {
            if (callbacks.onError)
            {
                callbacks.onError(DiscoveryErrorKind::GENERAL, "No radio scanner available");
            }
            return;
        }

        if (scanner_->checkPermission() == RadioPermission::LOCATION_SERVICE_OFF)
        {
            LABEL_LOG_WARN("Radio discovery unavailable: location service is off");
            if (callbacks.onError)
            {
                callbacks.onError(DiscoveryErrorKind::LOCATION_DISABLED, LOCATION_DISABLED_MESSAGE);
            }
            return;
        }

        if (!scanner_->isRadioEnabled())
        {
            LABEL_LOG_WARN("Radio discovery unavailable: radio is disabled");
            if (callbacks.onError)
            {
                callbacks.onError(DiscoveryErrorKind::RADIO_DISABLED, RADIO_DISABLED_MESSAGE);
            }
            return;
        }

        auto state = state_;
        const uint64_t runGeneration = ++state->generation;

        // Replay devices from earlier runs first
        std::vector<Device> cached;
        {
            std::lock_guard<std::mutex> lock(state->knownMutex);
            for (const auto &entry : state->knownDevices)
            {
                cached.push_back(entry.second);
            }
        }
        if (callbacks.onFound)
        {
            for (const auto &device : cached)
            {
                callbacks.onFound(device);
            }
        }
        LABEL_LOG_DEBUG("Radio discovery replayed {} cached devices", cached.size());

        RadioScanCallbacks scanCallbacks;
        scanCallbacks.onDeviceFound = [state, runGeneration, callbacks](const std::string &address, const std::string &name)
        {
            if (state->generation.load() != runGeneration)
            {
                return;
            }
            Device device = makeDevice(address, name);
            {
                std::lock_guard<std::mutex> lock(state->knownMutex);
                state->knownDevices[address] = device;
            }
            if (callbacks.onFound)
            {
                callbacks.onFound(device);
            }
        };
        scanCallbacks.onDeviceLost = [state, runGeneration, callbacks](const std::string &address)
        {
            if (state->generation.load() != runGeneration)
            {
                return;
            }
            Device device;
            {
                std::lock_guard<std::mutex> lock(state->knownMutex);
                auto it = state->knownDevices.find(address);
                device = it != state->knownDevices.end() ? it->second : makeDevice(address, "");
                state->knownDevices.erase(address);
            }
            if (callbacks.onGone)
            {
                callbacks.onGone(device);
            }
        };
        scanCallbacks.onFinished = [state, runGeneration, callbacks]()
        {
            if (state->generation.load() != runGeneration)
            {
                return;
            }
            state->scanning = false;
            if (callbacks.onFinished)
            {
                callbacks.onFinished();
            }
        };
        scanCallbacks.onError = [state, runGeneration, callbacks](const std::string &message)
        {
            if (state->generation.load() != runGeneration)
            {
                return;
            }
            state->scanning = false;
            LABEL_LOG_WARN("Radio discovery error: {}", message);
            if (callbacks.onError)
            {
                callbacks.onError(classifyError(message), message);
            }
        };

        state->scanning = true;
        if (!scanner_->startScan(scanCallbacks))
        {
            state->scanning = false;
            ++state->generation;
            LABEL_LOG_ERROR("Failed to start radio scan");
            if (callbacks.onError)
            {
                callbacks.onError(DiscoveryErrorKind::GENERAL, "Failed to start radio scan");
            }
            return;
        }
        LABEL_LOG_INFO("Radio discovery started");
    }

    void RadioDiscoverySource::stop()
    {
        ++state_->generation;
        if (state_->scanning.exchange(false) && scanner_)
        {
            scanner_->cancelScan();
            LABEL_LOG_INFO("Radio discovery cancelled");
        }
    }
} // namespace llink
