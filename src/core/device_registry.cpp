#include "core/device_registry.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>

namespace llink
{
    void DeviceRegistry::setChangeCallback(ChangeCallback callback)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changeCallback_ = std::move(callback);
    }

    std::vector<Device>::iterator DeviceRegistry::findLocked(const std::string &address)
    {
        return std::find_if(devices_.begin(), devices_.end(),
                            [&address](const Device &device)
                            { return device.address == address; });
    }

    void DeviceRegistry::notify()
    {
        // Snapshot under the lock, call outside it
        ChangeCallback callback;
        std::vector<Device> devices;
        std::optional<std::string> selected;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = changeCallback_;
            devices = devices_;
            selected = selectedAddress_;
        }
        if (callback)
        {
            callback(devices, selected);
        }
    }

    bool DeviceRegistry::add(const Device &device)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (device.address.empty() || findLocked(device.address) != devices_.end())
            {
                return false;
            }

            Device entry = device;
            // A new entry never arrives connected, the connection slot decides that
            entry.isConnected = false;
            devices_.push_back(entry);
        }

        LABEL_LOG_DEBUG("Registry added {}", StringUtils::maskString(device.address));
        notify();
        return true;
    }

    bool DeviceRegistry::remove(const std::string &address)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = findLocked(address);
            if (it == devices_.end())
            {
                return false;
            }
            devices_.erase(it);
            if (selectedAddress_ && *selectedAddress_ == address)
            {
                selectedAddress_.reset();
            }
        }

        LABEL_LOG_DEBUG("Registry removed {}", StringUtils::maskString(address));
        notify();
        return true;
    }

    void DeviceRegistry::select(const std::optional<std::string> &address)
    {
        bool releasedPrevious = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (selectedAddress_ == address)
            {
                return;
            }

            if (selectedAddress_)
            {
                auto previous = findLocked(*selectedAddress_);
                if (previous != devices_.end() && previous->isConnected)
                {
                    previous->isConnected = false;
                    previous->statusSeverity = StatusSeverity::DISCONNECTED;
                    previous->statusText = statusSeverityToString(StatusSeverity::DISCONNECTED);
                    releasedPrevious = true;
                }
            }
        }

        // Observers see the old device released before the new selection exists
        if (releasedPrevious)
        {
            notify();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            selectedAddress_ = address;
        }
        notify();
    }

    bool DeviceRegistry::updateSelectedStatus(const std::string &statusText, StatusSeverity severity)
    {
        bool releasedOthers = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!selectedAddress_)
            {
                return false;
            }
            auto it = findLocked(*selectedAddress_);
            if (it == devices_.end())
            {
                return false;
            }

            if (severity == StatusSeverity::CONNECTED)
            {
                for (auto &device : devices_)
                {
                    if (device.address != *selectedAddress_ && device.isConnected)
                    {
                        device.isConnected = false;
                        device.statusSeverity = StatusSeverity::DISCONNECTED;
                        device.statusText = statusSeverityToString(StatusSeverity::DISCONNECTED);
                        releasedOthers = true;
                    }
                }
            }
        }

        if (releasedOthers)
        {
            notify();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!selectedAddress_)
            {
                return false;
            }
            auto it = findLocked(*selectedAddress_);
            if (it == devices_.end())
            {
                return false;
            }
            it->statusText = statusText;
            it->statusSeverity = severity;
            it->isConnected = severity == StatusSeverity::CONNECTED;
        }
        notify();
        return true;
    }

    bool DeviceRegistry::synchronizeSelected(const std::string &connectedText)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!selectedAddress_)
            {
                return false;
            }
            auto it = findLocked(*selectedAddress_);
            if (it == devices_.end())
            {
                selectedAddress_.reset();
            }
            else if (it->isConnected)
            {
                return false;
            }
        }

        if (!getSelectedAddress())
        {
            notify();
            return true;
        }
        return updateSelectedStatus(connectedText, StatusSeverity::CONNECTED);
    }

    size_t DeviceRegistry::removeDisconnected()
    {
        size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto newEnd = std::remove_if(devices_.begin(), devices_.end(),
                                         [](const Device &device)
                                         { return !device.isConnected; });
            removed = static_cast<size_t>(std::distance(newEnd, devices_.end()));
            devices_.erase(newEnd, devices_.end());
            if (selectedAddress_ && findLocked(*selectedAddress_) == devices_.end())
            {
                selectedAddress_.reset();
            }
        }

        if (removed > 0)
        {
            notify();
        }
        return removed;
    }

    void DeviceRegistry::clear()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (devices_.empty() && !selectedAddress_)
            {
                return;
            }
            devices_.clear();
            selectedAddress_.reset();
        }
        notify();
    }

    std::vector<Device> DeviceRegistry::getDevices() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_;
    }

    std::optional<Device> DeviceRegistry::find(const std::string &address) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &device : devices_)
        {
            if (device.address == address)
            {
                return device;
            }
        }
        return std::nullopt;
    }

    bool DeviceRegistry::contains(const std::string &address) const
    {
        return find(address).has_value();
    }

    size_t DeviceRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.size();
    }

    std::optional<std::string> DeviceRegistry::getSelectedAddress() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return selectedAddress_;
    }

    size_t DeviceRegistry::connectedCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(devices_.begin(), devices_.end(),
                                                 [](const Device &device)
                                                 { return device.isConnected; }));
    }
} // namespace llink
