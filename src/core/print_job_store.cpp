#include "core/print_job_store.h"
#include <chrono>

namespace llink
{
    bool PrintJobStore::add(const PrintJob &job)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job.id.empty() || jobs_.count(job.id) > 0)
        {
            return false;
        }
        PrintJob entry = job;
        entry.status = PrintJobStatus::QUEUED;
        jobs_.emplace(entry.id, entry);
        order_.push_back(entry.id);
        return true;
    }

    std::optional<PrintJob> PrintJobStore::markPrinting(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.status != PrintJobStatus::QUEUED)
        {
            return std::nullopt;
        }
        it->second.status = PrintJobStatus::PRINTING;
        return it->second;
    }

    std::optional<PrintJob> PrintJobStore::resolve(const std::optional<std::string> &id, LLINK_ERROR_CODE code,
                                                   const std::string &message)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        PrintJob *target = nullptr;
        if (id)
        {
            auto it = jobs_.find(*id);
            if (it != jobs_.end() && it->second.status == PrintJobStatus::PRINTING)
            {
                target = &it->second;
            }
        }
        if (!target)
        {
            for (auto orderIt = order_.rbegin(); orderIt != order_.rend(); ++orderIt)
            {
                auto &job = jobs_.at(*orderIt);
                if (job.status == PrintJobStatus::PRINTING)
                {
                    target = &job;
                    break;
                }
            }
        }
        if (!target)
        {
            return std::nullopt;
        }

        target->completedAt = std::chrono::system_clock::now();
        target->errorCode = code;
        if (code == LLINK_ERROR_CODE::SUCCESS)
        {
            target->status = PrintJobStatus::COMPLETED;
        }
        else
        {
            target->status = PrintJobStatus::FAILED;
            target->errorMessage = message;
        }
        return *target;
    }

    std::vector<PrintJob> PrintJobStore::cancelActive(const std::string &reason)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PrintJob> cancelled;
        auto now = std::chrono::system_clock::now();
        for (const auto &id : order_)
        {
            auto &job = jobs_.at(id);
            if (!job.isTerminal())
            {
                job.status = PrintJobStatus::CANCELLED;
                job.completedAt = now;
                job.errorCode = LLINK_ERROR_CODE::OPERATION_CANCELLED;
                job.errorMessage = reason;
                cancelled.push_back(job);
            }
        }
        return cancelled;
    }

    std::optional<PrintJob> PrintJobStore::get(const std::string &id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<PrintJob> PrintJobStore::getAll() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PrintJob> result;
        result.reserve(order_.size());
        for (const auto &id : order_)
        {
            result.push_back(jobs_.at(id));
        }
        return result;
    }

    bool PrintJobStore::contains(const std::string &id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.count(id) > 0;
    }

    size_t PrintJobStore::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }
} // namespace llink
