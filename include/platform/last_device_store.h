#pragma once

#include <optional>
#include <string>
#include "types/device.h"

namespace llink
{
    /**
     * The device reconnected to by autoConnectLastPrinter
     */
    struct LastDevice
    {
        std::string address;
        std::string displayName;
        bool isWifi = false;
        PrinterFamily family = PrinterFamily::SMART_PRINTER;
    };

    /**
     * Platform key-value blob store (shared preferences, keychain, a file...)
     */
    class ILastDeviceStore
    {
    public:
        virtual ~ILastDeviceStore() = default;

        /**
         * @return std::nullopt if the key is absent
         */
        virtual std::optional<std::string> load(const std::string &key) = 0;

        /**
         * @return false if the value could not be stored
         */
        virtual bool save(const std::string &key, const std::string &value) = 0;

        virtual bool remove(const std::string &key) = 0;
    };

} // namespace llink
