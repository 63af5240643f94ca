#include "print/printer_commands.h"
#include "utils/utils.h"
#include <algorithm>

namespace llink
{
    const std::vector<int> &PrinterCommands::darknessLevels()
    {
        static const std::vector<int> levels = {-99, -75, -50, -25, 0, 25, 50, 75, 100, 125, 150, 175, 200};
        return levels;
    }

    bool PrinterCommands::isValidDarkness(int level)
    {
        const auto &levels = darknessLevels();
        return std::find(levels.begin(), levels.end(), level) != levels.end();
    }

    BizResult<std::string> PrinterCommands::darkness(int level)
    {
        if (!isValidDarkness(level))
        {
            return BizResult<std::string>::Error(LLINK_ERROR_CODE::INVALID_PARAMETER,
                                                 "Unsupported darkness level: " + std::to_string(level));
        }
        return BizResult<std::string>::Ok("! U1 setvar \"print.tone\" \"" + std::to_string(level) + "\"\n");
    }

    std::string PrinterCommands::mediaType(MediaType type)
    {
        switch (type)
        {
        case MediaType::LABEL:
            return "! U1 setvar \"media.type\" \"label\"\n"
                   "! U1 setvar \"media.sense_mode\" \"gap\"\n";
        case MediaType::BLACK_MARK:
            return "! U1 setvar \"media.type\" \"label\"\n"
                   "! U1 setvar \"media.sense_mode\" \"bar\"\n";
        case MediaType::JOURNAL:
        default:
            return "! U1 setvar \"media.type\" \"journal\"\n";
        }
    }

    std::string PrinterCommands::cutSequence()
    {
        static const char cut[] = {0x0a, 0x0a, 0x1d, 0x56, 0x01};
        return std::string(cut, sizeof(cut));
    }

    std::string PrinterCommands::applyOrientation(const std::string &payload, bool rotated)
    {
        std::string processed = payload;
        if (processed.find(ORIENTATION_NORMAL) == std::string::npos)
        {
            processed = StringUtils::replaceAll(processed, FORMAT_START, std::string(FORMAT_START) + ORIENTATION_NORMAL);
        }
        if (rotated)
        {
            processed = StringUtils::replaceAll(processed, ORIENTATION_NORMAL, ORIENTATION_INVERTED);
        }
        return processed;
    }
} // namespace llink
