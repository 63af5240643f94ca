#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "config.h"
#include "platform/transport.h"

namespace llink
{
    /**
     * Decides whether a print succeeded once the payload has been written.
     * The transport write itself never reports completion.
     */
    class IPrintVerifier
    {
    public:
        virtual ~IPrintVerifier() = default;

        virtual std::string getName() const = 0;

        /**
         * @param abandoned set when the caller stopped waiting; verification should return early
         */
        virtual VoidResult verify(ITransport &transport, const std::atomic<bool> &abandoned) = 0;
    };

    /**
     * Status-aware printers: settle, then read the host status
     */
    class SmartPrintVerifier : public IPrintVerifier
    {
    public:
        explicit SmartPrintVerifier(int settleMs) : settleMs_(settleMs) {}

        std::string getName() const override { return "smart"; }
        VoidResult verify(ITransport &transport, const std::atomic<bool> &abandoned) override;

        /**
         * Map status flags to a result. The first fault in priority order wins.
         */
        static VoidResult classifyStatus(const PrinterStatusFlags &status);

    private:
        int settleMs_;
    };

    /**
     * Raw socket printers: no status channel, only the socket state and a trailing cut
     */
    class GenericPrintVerifier : public IPrintVerifier
    {
    public:
        explicit GenericPrintVerifier(int settleMs) : settleMs_(settleMs) {}

        std::string getName() const override { return "generic"; }
        VoidResult verify(ITransport &transport, const std::atomic<bool> &abandoned) override;

    private:
        int settleMs_;
    };

    /**
     * PrintVerifierFactory - creates the verifier for a printer family
     */
    class PrintVerifierFactory
    {
    public:
        static std::unique_ptr<IPrintVerifier> createVerifier(PrinterFamily family,
                                                              const LabelPrintConfig &config,
                                                              bool overRadio);

    private:
        PrintVerifierFactory() = delete;
    };
} // namespace llink
