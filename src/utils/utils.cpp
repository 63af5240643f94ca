#include "utils/utils.h"
#include <algorithm>
#include <atomic>
#include <cctype>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <cstring>

namespace llink
{

    // ========== SDKVersion Implementation ==========

    std::string SDKVersion::getVersionString()
    {
        return std::to_string(MAJOR) + "." + std::to_string(MINOR) + "." + std::to_string(PATCH);
    }

    // ========== NetworkUtils Implementation ==========

    std::vector<BroadcastInfo> NetworkUtils::getBroadcastAddresses()
    {
        std::vector<BroadcastInfo> result;

        struct ifaddrs *ifaddr = nullptr;
        if (getifaddrs(&ifaddr) != 0)
        {
            return result;
        }

        for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
        {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET || !ifa->ifa_netmask)
                continue;

            if (ifa->ifa_flags & IFF_LOOPBACK)
                continue;

            sockaddr_in *ip = reinterpret_cast<sockaddr_in *>(ifa->ifa_addr);
            sockaddr_in *netmask = reinterpret_cast<sockaddr_in *>(ifa->ifa_netmask);

            uint32_t ip_val = ntohl(ip->sin_addr.s_addr);
            uint32_t mask_val = ntohl(netmask->sin_addr.s_addr);
            uint32_t broadcast = ip_val | ~mask_val;

            in_addr ip_addr, bcast_addr;
            ip_addr.s_addr = htonl(ip_val);
            bcast_addr.s_addr = htonl(broadcast);

            char ipStr[INET_ADDRSTRLEN];
            char bcastStr[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &ip_addr, ipStr, sizeof(ipStr));
            inet_ntop(AF_INET, &bcast_addr, bcastStr, sizeof(bcastStr));

            result.push_back({ifa->ifa_name, ipStr, bcastStr});
        }

        freeifaddrs(ifaddr);
        return result;
    }

    bool NetworkUtils::isValidIPAddress(const std::string &ip)
    {
        struct sockaddr_in sa;
        return inet_pton(AF_INET, ip.c_str(), &(sa.sin_addr)) == 1;
    }

    bool NetworkUtils::isValidPort(int port)
    {
        return port > 0 && port <= 65535;
    }

    bool NetworkUtils::enableBroadcast(int socket)
    {
        int broadcast_enable = 1;
        return setsockopt(socket, SOL_SOCKET, SO_BROADCAST, &broadcast_enable, sizeof(broadcast_enable)) == 0;
    }

    bool NetworkUtils::setSocketTimeout(int socket, int timeout_ms)
    {
        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
        {
            return false;
        }
        return setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    }

    // ========== StringUtils Implementation ==========

    std::vector<std::string> StringUtils::split(const std::string &str, const std::string &delimiter)
    {
        std::vector<std::string> tokens;
        if (delimiter.empty())
        {
            tokens.push_back(str);
            return tokens;
        }

        size_t start = 0;
        size_t end = str.find(delimiter);
        while (end != std::string::npos)
        {
            tokens.push_back(str.substr(start, end - start));
            start = end + delimiter.length();
            end = str.find(delimiter, start);
        }

        tokens.push_back(str.substr(start));
        return tokens;
    }

    std::string StringUtils::trim(const std::string &str)
    {
        size_t start = str.find_first_not_of(" \t\n\r\f\v");
        if (start == std::string::npos)
        {
            return "";
        }

        size_t end = str.find_last_not_of(" \t\n\r\f\v");
        return str.substr(start, end - start + 1);
    }

    std::string StringUtils::toLowerCase(const std::string &str)
    {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    bool StringUtils::containsIgnoreCase(const std::string &str, const std::string &needle)
    {
        return toLowerCase(str).find(toLowerCase(needle)) != std::string::npos;
    }

    std::string StringUtils::replaceAll(const std::string &str, const std::string &from, const std::string &to)
    {
        if (str.empty() || from.empty())
        {
            return str;
        }
        std::string result = str;
        size_t start_pos = 0;
        while ((start_pos = result.find(from, start_pos)) != std::string::npos)
        {
            result.replace(start_pos, from.length(), to);
            start_pos += to.length();
        }
        return result;
    }

    std::string StringUtils::maskString(const std::string &str, char maskChar)
    {
        size_t len = str.length();

        if (len <= 4)
        {
            return str;
        }

        if (len < 6)
        {
            std::string result;
            result.reserve(len);
            result.append(2, maskChar);
            result.append(str.substr(2));
            return result;
        }

        // Mask the centered half of the string
        size_t maskLength = len / 2;
        size_t maskStart = (len - maskLength) / 2;

        std::string result;
        result.reserve(len);
        result.append(str.substr(0, maskStart));
        result.append(maskLength, maskChar);
        result.append(str.substr(maskStart + maskLength));
        return result;
    }

    // ========== TimeUtils Implementation ==========

    long long TimeUtils::getCurrentTimestamp()
    {
        return toTimestamp(std::chrono::system_clock::now());
    }

    long long TimeUtils::toTimestamp(const std::chrono::system_clock::time_point &timePoint)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count();
    }

    std::string TimeUtils::formatDuration(int milliseconds)
    {
        if (milliseconds % 1000 == 0)
        {
            int seconds = milliseconds / 1000;
            return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
        }
        return std::to_string(milliseconds) + " ms";
    }

    // ========== IdUtils Implementation ==========

    std::string IdUtils::generateId(const std::string &prefix)
    {
        static std::atomic<unsigned long long> sequence{0};
        return prefix + "_" + std::to_string(TimeUtils::getCurrentTimestamp()) + "_" +
               std::to_string(++sequence);
    }

} // namespace llink
