#pragma once
namespace llink
{
    /**
     * Response status code enumeration
     */
    enum class LLINK_ERROR_CODE
    {
        // Success status
        SUCCESS = 0, // Operation successful

        // General errors (1-99)
        UNKNOWN_ERROR = 1,         // Unknown error
        NOT_INITIALIZED = 2,       // Not initialized
        INVALID_PARAMETER = 3,     // Invalid parameter (address, payload, darkness, etc.)
        OPERATION_TIMEOUT = 4,     // Operation timeout (discovery, connection, print)
        OPERATION_CANCELLED = 5,   // Operation canceled
        OPERATION_IN_PROGRESS = 6, // Operation in progress (e.g. another connect attempt)
        NETWORK_ERROR = 8,         // Network error
        DISPOSED = 11,             // Operation attempted after dispose()

        // Discovery errors (100-199)
        PERMISSION_DENIED = 100,         // Radio/location permission denied
        DISCOVERY_ALREADY_RUNNING = 101, // A discovery session is already scanning
        DISCOVERY_FAILED = 102,          // Discovery source reported an error

        // 1000-1099 Printer connection errors
        PRINTER_NOT_FOUND = 1000,        // Printer not found
        PRINTER_CONNECTION_ERROR = 1001, // Transport could not be opened
        PRINTER_CONNECTION_LOST = 1002,  // Transport dropped during an operation
        PRINTER_NOT_CONNECTED = 1003,    // No transport is connected
        PRINTER_COMMAND_FAILED = 1005,   // Printer command execution failed

        // 1100-1199 Print faults reported by printer status
        PRINT_FAULT_PAPER_OUT = 1100,
        PRINT_FAULT_HEAD_OPEN = 1101,
        PRINT_FAULT_PAUSED = 1102,
        PRINT_FAULT_HEAD_TOO_HOT = 1103,
        PRINT_FAULT_HEAD_COLD = 1104,
        PRINT_FAULT_RIBBON_OUT = 1105,
        PRINT_FAULT_NOT_READY = 1106,
    };

    static inline bool isPrintFault(LLINK_ERROR_CODE code)
    {
        int value = static_cast<int>(code);
        return value >= static_cast<int>(LLINK_ERROR_CODE::PRINT_FAULT_PAPER_OUT) &&
               value <= static_cast<int>(LLINK_ERROR_CODE::PRINT_FAULT_NOT_READY);
    }
} // namespace llink
