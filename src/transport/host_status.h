#pragma once

#include <optional>
#include <string>
#include "types/device.h"

namespace llink
{
    /**
     * Parser for the ~HS host status reply.
     *
     * The reply is three <STX>...<ETX> framed, comma separated strings:
     *   string 1: aaa,b,c,dddd,eee,f,g,h,iii,j,k,l
     *             b paper out, c paused, k under temperature, l over temperature
     *   string 2: mmm,n,o,p,q,r,s,t,uuuuuuuu,v,www
     *             o head up, p ribbon out
     *   string 3: xxxx,y
     */
    class HostStatusParser
    {
    public:
        static constexpr const char *QUERY_COMMAND = "~HS\r\n";
        static constexpr char STX = 0x02;
        static constexpr char ETX = 0x03;
        static constexpr int FRAME_COUNT = 3;

        /**
         * Number of complete frames in a (possibly partial) reply
         */
        static int countFrames(const std::string &response);

        /**
         * @return std::nullopt if the reply is truncated or malformed
         */
        static std::optional<PrinterStatusFlags> parse(const std::string &response);
    };
} // namespace llink
