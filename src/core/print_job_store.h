#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types/print_job.h"

namespace llink
{
    /**
     * History of print jobs. Terminal jobs are never modified again.
     * Mutations are made from the reconciler thread only.
     */
    class PrintJobStore
    {
    public:
        /**
         * Insert a new job in QUEUED state
         * @return false if the id already exists
         */
        bool add(const PrintJob &job);

        /**
         * QUEUED -> PRINTING
         */
        std::optional<PrintJob> markPrinting(const std::string &id);

        /**
         * Resolve the named job if it is still printing, otherwise the most recent printing job.
         * @param code SUCCESS completes the job, anything else fails it with message
         * @return the resolved job, std::nullopt if no job was printing
         */
        std::optional<PrintJob> resolve(const std::optional<std::string> &id, LLINK_ERROR_CODE code,
                                        const std::string &message);

        /**
         * Cancel every job that is not terminal
         */
        std::vector<PrintJob> cancelActive(const std::string &reason);

        std::optional<PrintJob> get(const std::string &id) const;
        std::vector<PrintJob> getAll() const;
        bool contains(const std::string &id) const;
        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, PrintJob> jobs_;
        std::vector<std::string> order_; // Creation order
    };
} // namespace llink
