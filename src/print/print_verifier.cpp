#include "print/print_verifier.h"
#include "print/printer_commands.h"
#include "utils/logger.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace llink
{
    namespace
    {
        // Sleep in short slices so an abandoned attempt returns quickly
        bool settle(int milliseconds, const std::atomic<bool> &abandoned)
        {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(milliseconds);
            while (!abandoned.load())
            {
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                {
                    return true;
                }
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                    deadline - now, std::chrono::milliseconds(50)));
            }
            return false;
        }

        VoidResult abandonedResult()
        {
            return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED, "Print verification abandoned");
        }

        std::optional<PrinterStatusFlags> queryStatusSafely(ITransport &transport)
        {
            try
            {
                return transport.queryStatus();
            }
            catch (const std::exception &e)
            {
                LABEL_LOG_WARN("Status query threw: {}", e.what());
                return std::nullopt;
            }
        }

        bool isOpenSafely(ITransport &transport)
        {
            try
            {
                return transport.isOpen();
            }
            catch (const std::exception &e)
            {
                LABEL_LOG_WARN("Transport state check threw: {}", e.what());
                return false;
            }
        }
    } // namespace

    // ========== SmartPrintVerifier ==========

    VoidResult SmartPrintVerifier::classifyStatus(const PrinterStatusFlags &status)
    {
        if (status.isReadyToPrint)
        {
            return VoidResult::Success();
        }
        if (status.isPaperOut)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINT_FAULT_PAPER_OUT, "Paper out");
        }
        if (status.isHeadOpen)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINT_FAULT_HEAD_OPEN, "Printer head open");
        }
        if (status.isPaused)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINT_FAULT_PAUSED, "Printer paused");
        }
        if (status.isHeadTooHot)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINT_FAULT_HEAD_TOO_HOT, "Printer head too hot");
        }
        if (status.isHeadCold)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINT_FAULT_HEAD_COLD, "Printer head too cold");
        }
        if (status.isRibbonOut)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINT_FAULT_RIBBON_OUT, "Ribbon out");
        }
        return VoidResult::Error(LLINK_ERROR_CODE::PRINT_FAULT_NOT_READY, "Printer not ready");
    }

    VoidResult SmartPrintVerifier::verify(ITransport &transport, const std::atomic<bool> &abandoned)
    {
        if (!settle(settleMs_, abandoned))
        {
            return abandonedResult();
        }

        std::optional<PrinterStatusFlags> status = queryStatusSafely(transport);
        if (!status)
        {
            LABEL_LOG_WARN("Printer status unavailable after print, assuming success");
            return VoidResult::Success();
        }

        VoidResult result = classifyStatus(*status);
        if (!result.isSuccess())
        {
            LABEL_LOG_WARN("Printer reported a fault after print: {}", result.message);
        }
        return result;
    }

    // ========== GenericPrintVerifier ==========

    VoidResult GenericPrintVerifier::verify(ITransport &transport, const std::atomic<bool> &abandoned)
    {
        if (!settle(settleMs_, abandoned))
        {
            return abandonedResult();
        }
        if (!isOpenSafely(transport))
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, "Connection lost during printing");
        }

        VoidResult cut;
        try
        {
            cut = transport.write(PrinterCommands::cutSequence());
        }
        catch (const std::exception &e)
        {
            cut = VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, e.what());
        }
        if (!cut.isSuccess())
        {
            LABEL_LOG_WARN("Failed to send cut sequence: {}", cut.message);
            return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, "Connection lost after printing");
        }

        if (!settle(settleMs_, abandoned))
        {
            return abandonedResult();
        }
        if (!isOpenSafely(transport))
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, "Connection lost after printing");
        }
        return VoidResult::Success();
    }

    // ========== PrintVerifierFactory ==========

    std::unique_ptr<IPrintVerifier> PrintVerifierFactory::createVerifier(PrinterFamily family,
                                                                         const LabelPrintConfig &config,
                                                                         bool overRadio)
    {
        switch (family)
        {
        case PrinterFamily::GENERIC_SOCKET_PRINTER:
            return std::make_unique<GenericPrintVerifier>(config.genericSettleMs);
        case PrinterFamily::SMART_PRINTER:
        default:
            return std::make_unique<SmartPrintVerifier>(config.smartSettleMs + (overRadio ? config.radioExtraSettleMs : 0));
        }
    }
} // namespace llink
