#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "config.h"
#include "connection/connection_manager.h"
#include "core/event_reconciler.h"
#include "types/print_job.h"
#include "utils/thread_pool.h"

namespace llink
{
    /**
     * Print Executor
     *
     * Writes one payload at a time to the leased transport and infers the outcome
     * from the printer state afterwards. The whole attempt runs on the I/O pool under
     * the print timeout; a result that arrives after the timeout is dropped.
     */
    class PrintExecutor
    {
    public:
        static constexpr size_t MAX_PAYLOAD_SIZE = 65536;

        PrintExecutor(const LabelPrintConfig &config,
                      ConnectionManager &connection,
                      EventReconciler &reconciler,
                      ThreadPool &ioPool);

        /**
         * Print a payload and wait for its outcome.
         * The returned job is terminal whenever the job was started; on failure the
         * result code carries the failure kind and data carries the FAILED job.
         */
        BizResult<PrintJob> print(const std::string &payload, const std::optional<std::string> &jobId = std::nullopt);

        /**
         * @return the new rotation state
         */
        bool toggleRotation();
        bool isRotated() const { return rotated_.load(); }

        static VoidResult validatePayload(const std::string &payload);

    private:
        struct Attempt
        {
            std::mutex mutex;
            TransportPtr transport;
            std::atomic<bool> abandoned{false};
        };

        VoidResult execute(const std::string &data, const std::shared_ptr<Attempt> &attempt);
        PrintJob finalJob(const PrintJob &started, const VoidResult &result);
        void publish(CoreEvent event);

        LabelPrintConfig config_;
        ConnectionManager &connection_;
        EventReconciler &reconciler_;
        ThreadPool &ioPool_;

        // Serializes print() calls; one job in flight
        std::mutex printMutex_;
        std::atomic<bool> rotated_{false};
    };
} // namespace llink
