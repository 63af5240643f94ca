#pragma once

#include <string>
#include <vector>
#include "types/biz.h"
#include "types/device.h"

namespace llink
{
    /**
     * Command templates for printer settings. Payloads themselves stay opaque;
     * applyOrientation() is the only edit made to caller data.
     */
    class PrinterCommands
    {
    public:
        static constexpr const char *CALIBRATE = "~jc^xa^jus^xz";
        static constexpr const char *FORMAT_START = "^XA";
        static constexpr const char *ORIENTATION_NORMAL = "^PON";
        static constexpr const char *ORIENTATION_INVERTED = "^POI";

        static const std::vector<int> &darknessLevels();
        static bool isValidDarkness(int level);

        /**
         * @return INVALID_PARAMETER if the level is not one of darknessLevels()
         */
        static BizResult<std::string> darkness(int level);

        static std::string mediaType(MediaType type);

        static std::string calibrate() { return CALIBRATE; }

        /**
         * Trailing feed and cut for generic socket printers
         */
        static std::string cutSequence();

        /**
         * Insert ^PON after ^XA when no orientation is given, then swap it for ^POI if rotated
         */
        static std::string applyOrientation(const std::string &payload, bool rotated);

    private:
        PrinterCommands() = delete;
    };
} // namespace llink
