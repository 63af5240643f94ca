#pragma once

#include <functional>
#include <string>

namespace llink
{
    enum class RadioPermission
    {
        GRANTED,
        DENIED,
        LOCATION_SERVICE_OFF,
    };

    struct RadioScanCallbacks
    {
        std::function<void(const std::string &address, const std::string &name)> onDeviceFound;
        std::function<void(const std::string &address)> onDeviceLost;
        std::function<void()> onFinished;
        std::function<void(const std::string &message)> onError;
    };

    /**
     * Platform short-range radio scanner (e.g. Bluetooth classic inquiry).
     * A scan keeps running until cancelScan().
     */
    class IRadioScanner
    {
    public:
        virtual ~IRadioScanner() = default;

        virtual RadioPermission checkPermission() = 0;

        /**
         * Ask the user for permission
         * @return true if granted
         */
        virtual bool requestPermission() = 0;

        virtual bool isRadioEnabled() = 0;

        /**
         * @return false if the scan could not be started
         */
        virtual bool startScan(const RadioScanCallbacks &callbacks) = 0;

        virtual void cancelScan() = 0;
    };

} // namespace llink
