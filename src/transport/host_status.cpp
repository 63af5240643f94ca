#include "transport/host_status.h"
#include "utils/utils.h"
#include <vector>

namespace llink
{
    namespace
    {
        constexpr size_t STRING1_MIN_FIELDS = 12;
        constexpr size_t STRING2_MIN_FIELDS = 4;

        constexpr size_t FIELD_PAPER_OUT = 1;
        constexpr size_t FIELD_PAUSED = 2;
        constexpr size_t FIELD_UNDER_TEMPERATURE = 10;
        constexpr size_t FIELD_OVER_TEMPERATURE = 11;
        constexpr size_t FIELD_HEAD_UP = 2;
        constexpr size_t FIELD_RIBBON_OUT = 3;

        std::vector<std::string> extractFrames(const std::string &response)
        {
            std::vector<std::string> frames;
            size_t pos = 0;
            while (true)
            {
                size_t start = response.find(HostStatusParser::STX, pos);
                if (start == std::string::npos)
                {
                    break;
                }
                size_t end = response.find(HostStatusParser::ETX, start + 1);
                if (end == std::string::npos)
                {
                    break;
                }
                frames.push_back(response.substr(start + 1, end - start - 1));
                pos = end + 1;
            }
            return frames;
        }

        bool flagSet(const std::vector<std::string> &fields, size_t index)
        {
            return StringUtils::trim(fields[index]) == "1";
        }
    }

    int HostStatusParser::countFrames(const std::string &response)
    {
        return static_cast<int>(extractFrames(response).size());
    }

    std::optional<PrinterStatusFlags> HostStatusParser::parse(const std::string &response)
    {
        auto frames = extractFrames(response);
        if (frames.size() < 2)
        {
            return std::nullopt;
        }

        auto string1 = StringUtils::split(frames[0], ",");
        auto string2 = StringUtils::split(frames[1], ",");
        if (string1.size() < STRING1_MIN_FIELDS || string2.size() < STRING2_MIN_FIELDS)
        {
            return std::nullopt;
        }

        PrinterStatusFlags flags;
        flags.isPaperOut = flagSet(string1, FIELD_PAPER_OUT);
        flags.isPaused = flagSet(string1, FIELD_PAUSED);
        flags.isHeadCold = flagSet(string1, FIELD_UNDER_TEMPERATURE);
        flags.isHeadTooHot = flagSet(string1, FIELD_OVER_TEMPERATURE);
        flags.isHeadOpen = flagSet(string2, FIELD_HEAD_UP);
        flags.isRibbonOut = flagSet(string2, FIELD_RIBBON_OUT);
        flags.isReadyToPrint = !(flags.isPaperOut || flags.isPaused || flags.isHeadCold ||
                                 flags.isHeadTooHot || flags.isHeadOpen || flags.isRibbonOut);
        return flags;
    }
} // namespace llink
