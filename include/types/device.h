#pragma once
#include "biz.h"
#include <string>
#include <vector>
#include <optional>
namespace llink
{
    /**
     * Display severity of a device status line
     */
    enum class StatusSeverity
    {
        DISCONNECTED = 0,
        CONNECTING = 1,
        CONNECTED = 2,
    };

    /**
     * Printer family, selects the write and verification path
     */
    enum class PrinterFamily
    {
        SMART_PRINTER = 0,          // Status-aware printer, verified by status query
        GENERIC_SOCKET_PRINTER = 1, // Raw socket printer without telemetry
    };

    /**
     * Connection state machine phase
     */
    enum class ConnectionPhase
    {
        DISCONNECTED,
        CONNECTING,
        CONNECTED,
        DISCONNECTING,
    };

    /**
     * Media type accepted by configure()
     */
    enum class MediaType
    {
        LABEL,
        BLACK_MARK,
        JOURNAL,
    };

    /**
     * A printer known to the device registry
     */
    struct Device
    {
        std::string address;     // Unique key: MAC address for radio, IP address for network
        std::string displayName; // Friendly name reported by discovery
        bool isWifi = false;     // true when found by the network source
        std::string statusText;  // Last status line, e.g. "Connected"
        StatusSeverity statusSeverity = StatusSeverity::DISCONNECTED;
        bool isConnected = false;

        bool operator==(const Device &other) const
        {
            return address == other.address && displayName == other.displayName &&
                   isWifi == other.isWifi && statusText == other.statusText &&
                   statusSeverity == other.statusSeverity && isConnected == other.isConnected;
        }
    };

    /**
     * Read-only view of the connection slot
     */
    struct ConnectionState
    {
        std::optional<std::string> address;
        PrinterFamily family = PrinterFamily::SMART_PRINTER;
        ConnectionPhase phase = ConnectionPhase::DISCONNECTED;

        bool isConnected() const { return phase == ConnectionPhase::CONNECTED; }
    };

    /**
     * Status flags reported by a status-aware printer
     */
    struct PrinterStatusFlags
    {
        bool isReadyToPrint = false;
        bool isPaperOut = false;
        bool isHeadOpen = false;
        bool isPaused = false;
        bool isHeadTooHot = false;
        bool isHeadCold = false;
        bool isRibbonOut = false;
    };

    static std::string statusSeverityToString(StatusSeverity severity)
    {
        switch (severity)
        {
        case StatusSeverity::DISCONNECTED:
            return "Disconnected";
        case StatusSeverity::CONNECTING:
            return "Connecting";
        case StatusSeverity::CONNECTED:
            return "Connected";
        default:
            return "Unknown";
        }
    }

    static std::string printerFamilyToString(PrinterFamily family)
    {
        switch (family)
        {
        case PrinterFamily::SMART_PRINTER:
            return "SmartPrinter";
        case PrinterFamily::GENERIC_SOCKET_PRINTER:
            return "GenericSocketPrinter";
        default:
            return "Unknown";
        }
    }

    static std::string connectionPhaseToString(ConnectionPhase phase)
    {
        switch (phase)
        {
        case ConnectionPhase::DISCONNECTED:
            return "Disconnected";
        case ConnectionPhase::CONNECTING:
            return "Connecting";
        case ConnectionPhase::CONNECTED:
            return "Connected";
        case ConnectionPhase::DISCONNECTING:
            return "Disconnecting";
        default:
            return "Unknown";
        }
    }

    static std::string mediaTypeToString(MediaType type)
    {
        switch (type)
        {
        case MediaType::LABEL:
            return "Label";
        case MediaType::BLACK_MARK:
            return "BlackMark";
        case MediaType::JOURNAL:
            return "Journal";
        default:
            return "Unknown";
        }
    }

    /**
     * Radio addresses are colon separated MAC addresses, everything else is treated as a network host
     */
    static inline bool isRadioAddress(const std::string &address)
    {
        return address.find(':') != std::string::npos;
    }

} // namespace llink
