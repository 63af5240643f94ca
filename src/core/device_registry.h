#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "types/device.h"

namespace llink
{
    /**
     * Device Registry
     * Responsibilities:
     * 1. Keep discovered devices in discovery order, unique by address
     * 2. Track the single selected address
     * 3. Enforce that at most one device is marked connected
     * 4. Notify the observer after every visible change
     *
     * Mutations are made from the reconciler thread only. Reads are safe from any thread.
     */
    class DeviceRegistry
    {
    public:
        using ChangeCallback = std::function<void(const std::vector<Device> &devices,
                                                  const std::optional<std::string> &selectedAddress)>;

        DeviceRegistry() = default;

        void setChangeCallback(ChangeCallback callback);

        // ========== Mutations ==========

        /**
         * Add a device unless its address is already present
         * @return true if added
         */
        bool add(const Device &device);

        /**
         * Remove a device if present. Clears the selection when it was selected.
         * @return true if removed
         */
        bool remove(const std::string &address);

        /**
         * Change the selected address. The previously selected device loses its connected mark first.
         */
        void select(const std::optional<std::string> &address);

        /**
         * Update the status line of the selected device only
         * @return false if nothing is selected or the selected device is not in the registry
         */
        bool updateSelectedStatus(const std::string &statusText, StatusSeverity severity);

        /**
         * Mark the selected device connected unless it already is.
         * Clears the selection if the device is no longer in the registry.
         * @return true if the registry changed
         */
        bool synchronizeSelected(const std::string &connectedText);

        /**
         * Drop every device that is not connected
         * @return number of removed devices
         */
        size_t removeDisconnected();

        /**
         * Remove all devices and the selection
         */
        void clear();

        // ========== Queries ==========

        std::vector<Device> getDevices() const;
        std::optional<Device> find(const std::string &address) const;
        bool contains(const std::string &address) const;
        size_t size() const;
        std::optional<std::string> getSelectedAddress() const;
        size_t connectedCount() const;

    private:
        std::vector<Device>::iterator findLocked(const std::string &address);
        void notify();

        mutable std::mutex mutex_;
        std::vector<Device> devices_;
        std::optional<std::string> selectedAddress_;
        ChangeCallback changeCallback_;
    };
} // namespace llink
