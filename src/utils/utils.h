#pragma once

#include <string>
#include <vector>
#include <chrono>
namespace llink
{

    /**
     * Library version information
     */
    class SDKVersion
    {
    public:
        static constexpr int MAJOR = 1;
        static constexpr int MINOR = 0;
        static constexpr int PATCH = 0;

        static std::string getVersionString();
    };

    struct BroadcastInfo
    {
        std::string interfaceName;
        std::string ip;
        std::string broadcast;
    };

    /**
     * Network utility class
     */
    class NetworkUtils
    {
    public:
        /**
         * IPv4 broadcast address of every non-loopback interface
         */
        static std::vector<BroadcastInfo> getBroadcastAddresses();

        /**
         * Check if the IP address is valid
         * @param ip IP address
         * @return true if valid
         */
        static bool isValidIPAddress(const std::string &ip);

        /**
         * Check if the port is valid
         * @param port Port number
         * @return true if valid
         */
        static bool isValidPort(int port);

        /**
         * Enable broadcast on a socket
         * @param socket Socket descriptor
         * @return true if successful
         */
        static bool enableBroadcast(int socket);

        /**
         * Set send and receive timeouts on a socket
         * @param socket Socket descriptor
         * @param timeout_ms Timeout in milliseconds
         * @return true if successful
         */
        static bool setSocketTimeout(int socket, int timeout_ms);
    };

    /**
     * String utility class
     */
    class StringUtils
    {
    public:
        static std::vector<std::string> split(const std::string &str, const std::string &delimiter);

        static std::string trim(const std::string &str);

        static std::string toLowerCase(const std::string &str);

        static bool containsIgnoreCase(const std::string &str, const std::string &needle);

        static std::string replaceAll(const std::string &str, const std::string &from, const std::string &to);

        /**
         * Mask the middle of a string for logging
         * @param str String to mask
         * @param maskChar Mask character
         * @return Masked string
         */
        static std::string maskString(const std::string &str, char maskChar = '*');
    };

    /**
     * Time utility class
     */
    class TimeUtils
    {
    public:
        /**
         * Get the current timestamp (milliseconds)
         * @return Timestamp
         */
        static long long getCurrentTimestamp();

        /**
         * Milliseconds since epoch of a time point
         */
        static long long toTimestamp(const std::chrono::system_clock::time_point &timePoint);

        /**
         * "30 seconds" for whole seconds, "250 ms" otherwise
         */
        static std::string formatDuration(int milliseconds);
    };

    /**
     * Identifier generation
     */
    class IdUtils
    {
    public:
        /**
         * Generate "<prefix>_<epoch-ms>_<sequence>", unique within the process
         */
        static std::string generateId(const std::string &prefix);
    };

} // namespace llink
