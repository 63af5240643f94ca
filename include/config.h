#pragma once

#include <string>
#include <cstddef>
#include "label_export.h"
#include "types/biz.h"
namespace llink
{
    /**
     * Unified configuration for all LabelLink components
     */

    /**
     * Logging configuration
     */
    struct LabelLogConfig
    {
        int logLevel = 2;                         // Log level: 0-TRACE, 1-DEBUG, 2-INFO, 3-WARN, 4-ERROR, 5-CRITICAL, 6-OFF
        bool logEnableConsole = true;             // Enable console output
        bool logEnableFile = false;               // Enable file output
        std::string logFileName;                  // Log file name
        size_t logMaxFileSize = 10 * 1024 * 1024; // Maximum log file size (bytes)
        size_t logMaxFiles = 5;                   // Maximum number of log files
    };

    struct LabelDiscoveryConfig
    {
        int timeoutMs = 45000;           // Global session timeout
        int networkProbePeriodMs = 6000; // Bounded lifetime of one network probe
        int networkProbePort = 4201;     // UDP port printers answer discovery on
        int receiveWindowMs = 500;       // select() window inside the probe loop
    };

    struct LabelConnectionConfig
    {
        int timeoutMs = 30000;       // Transport open timeout
        int settleDelayMs = 500;     // Delay after tearing down a previous connection
        int smartPrinterPort = 6101; // TCP port of status-aware printers
        int genericPrinterPort = 9100;
        int socketIoTimeoutMs = 5000; // SO_SNDTIMEO / SO_RCVTIMEO on TCP transports
    };

    struct LabelPrintConfig
    {
        int timeoutMs = 30000;             // Whole write + verify sequence
        int smartSettleMs = 1500;          // Wait before querying status
        int radioExtraSettleMs = 500;      // Added to smartSettleMs over radio
        int genericSettleMs = 100;         // Wait before socket state checks
        int statusQueryTimeoutMs = 3000;   // Host status reply window
    };

    /**
     * Complete LabelLink configuration
     */
    struct LabelLinkConfig
    {
        LabelLogConfig log;
        LabelDiscoveryConfig discovery;
        LabelConnectionConfig connection;
        LabelPrintConfig print;

        bool enableDebugLogging = false;     // Forces DEBUG level
        bool autoConnectLastPrinter = false; // Reconnect to the stored device on initialize
    };

    /**
     * Parse a JSON configuration document. Missing keys keep their defaults.
     * @return INVALID_PARAMETER if the document is malformed
     */
    LABEL_LINK_API BizResult<LabelLinkConfig> parseConfig(const std::string &json);

    /**
     * Read and parse a JSON configuration file
     * @return INVALID_PARAMETER if the file cannot be read or parsed
     */
    LABEL_LINK_API BizResult<LabelLinkConfig> loadConfigFromFile(const std::string &path);

    LABEL_LINK_API std::string configToJson(const LabelLinkConfig &config);

} // namespace llink
