#include "print/print_executor.h"
#include "print/print_verifier.h"
#include "print/printer_commands.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <chrono>

namespace llink
{
    PrintExecutor::PrintExecutor(const LabelPrintConfig &config,
                                 ConnectionManager &connection,
                                 EventReconciler &reconciler,
                                 ThreadPool &ioPool)
        : config_(config), connection_(connection), reconciler_(reconciler), ioPool_(ioPool)
    {
    }

    VoidResult PrintExecutor::validatePayload(const std::string &payload)
    {
        if (payload.empty())
        {
            return VoidResult::Error(LLINK_ERROR_CODE::INVALID_PARAMETER, "Print data must not be empty");
        }
        if (payload.size() > MAX_PAYLOAD_SIZE)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::INVALID_PARAMETER,
                                     "Print data exceeds " + std::to_string(MAX_PAYLOAD_SIZE) + " bytes");
        }
        return VoidResult::Success();
    }

    bool PrintExecutor::toggleRotation()
    {
        bool rotated = !rotated_.load();
        rotated_ = rotated;
        LABEL_LOG_INFO("Print rotation {}", rotated ? "inverted" : "normal");
        return rotated;
    }

    BizResult<PrintJob> PrintExecutor::print(const std::string &payload, const std::optional<std::string> &jobId)
    {
        VoidResult valid = validatePayload(payload);
        if (!valid.isSuccess())
        {
            LABEL_LOG_WARN("Rejected print: {}", valid.message);
            return BizResult<PrintJob>(valid);
        }
        if (jobId && StringUtils::trim(*jobId).empty())
        {
            return BizResult<PrintJob>::Error(LLINK_ERROR_CODE::INVALID_PARAMETER, "Print job id must not be empty");
        }
        if (jobId && reconciler_.printJobs().contains(*jobId))
        {
            return BizResult<PrintJob>::Error(LLINK_ERROR_CODE::INVALID_PARAMETER, "Print job id already exists: " + *jobId);
        }

        std::lock_guard<std::mutex> serial(printMutex_);

        if (!connection_.getState().isConnected())
        {
            LABEL_LOG_WARN("Print rejected: no printer connected");
            return BizResult<PrintJob>::Error(LLINK_ERROR_CODE::PRINTER_NOT_CONNECTED, "Printer is not connected");
        }

        PrintJob job;
        job.id = jobId.value_or(IdUtils::generateId("print"));
        job.payload = payload;
        job.status = PrintJobStatus::QUEUED;
        job.createdAt = std::chrono::system_clock::now();

        publish(CoreEvent::printStarted(job));
        publish(CoreEvent::statusChanged("Sending data", StatusSeverity::CONNECTED));
        LABEL_LOG_INFO("Print job {} started ({} bytes)", job.id, payload.size());

        const std::string data = PrinterCommands::applyOrientation(payload, rotated_.load());
        auto attempt = std::make_shared<Attempt>();

        VoidResult result;
        try
        {
            std::future<VoidResult> pending = ioPool_.enqueue([this, data, attempt]()
                                                              { return execute(data, attempt); });

            if (pending.wait_for(std::chrono::milliseconds(config_.timeoutMs)) != std::future_status::ready)
            {
                attempt->abandoned = true;
                result = VoidResult::Error(LLINK_ERROR_CODE::OPERATION_TIMEOUT,
                                           "Print operation timed out after " + TimeUtils::formatDuration(config_.timeoutMs));

                TransportPtr transport;
                {
                    std::lock_guard<std::mutex> lock(attempt->mutex);
                    transport = attempt->transport;
                }
                if (transport)
                {
                    connection_.abortTransport(transport, "print timed out");
                }
            }
            else
            {
                result = pending.get();
            }
        }
        catch (const std::exception &e)
        {
            attempt->abandoned = true;
            result = VoidResult::Error(LLINK_ERROR_CODE::UNKNOWN_ERROR, std::string("Print failed: ") + e.what());
        }

        if (result.isSuccess())
        {
            LABEL_LOG_INFO("Print job {} completed", job.id);
            publish(CoreEvent::printComplete(job.id));
            publish(CoreEvent::statusChanged("Connected", StatusSeverity::CONNECTED));
        }
        else
        {
            LABEL_LOG_WARN("Print job {} failed: {}", job.id, result.message);
            publish(CoreEvent::printError(job.id, result.code, result.message));
            publish(CoreEvent::statusChanged("Print Error: " + result.message, StatusSeverity::CONNECTED));
        }

        PrintJob finished = finalJob(job, result);
        if (result.isSuccess())
        {
            return BizResult<PrintJob>::Ok(finished);
        }
        return BizResult<PrintJob>(result.code, result.message, finished);
    }

    VoidResult PrintExecutor::execute(const std::string &data, const std::shared_ptr<Attempt> &attempt)
    {
        std::optional<TransportLease> lease = connection_.acquireLease();
        if (!lease)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_NOT_CONNECTED, "Printer is not connected");
        }

        TransportPtr transport = lease->transport;
        const ConnectionState state = lease->state;
        {
            std::lock_guard<std::mutex> lock(attempt->mutex);
            attempt->transport = transport;
        }
        if (attempt->abandoned)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED, "Print abandoned");
        }

        VoidResult written;
        try
        {
            written = transport->write(data);
        }
        catch (const std::exception &e)
        {
            LABEL_LOG_ERROR("Transport threw while writing print data: {}", e.what());
            written = VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, e.what());
        }
        if (!written.isSuccess())
        {
            lease.reset();
            if (!attempt->abandoned)
            {
                connection_.handleTransportFailure(transport, "write failed: " + written.message);
            }
            return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, "Connection error: " + written.message);
        }

        auto verifier = PrintVerifierFactory::createVerifier(state.family, config_,
                                                             isRadioAddress(state.address.value_or("")));
        LABEL_LOG_DEBUG("Verifying print with {} verifier", verifier->getName());
        VoidResult verified = verifier->verify(*transport, attempt->abandoned);

        lease.reset();
        if (verified.code == LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST && !attempt->abandoned)
        {
            connection_.handleTransportFailure(transport, verified.message);
        }
        return verified;
    }

    void PrintExecutor::publish(CoreEvent event)
    {
        const CoreEventType type = event.type;
        if (!reconciler_.post(std::move(event)))
        {
            LABEL_LOG_DEBUG("Dropped {} event, reconciler stopped", coreEventTypeToString(type));
        }
    }

    PrintJob PrintExecutor::finalJob(const PrintJob &started, const VoidResult &result)
    {
        try
        {
            auto stored = reconciler_.submit([this, id = started.id]()
                                             { return reconciler_.printJobs().get(id); })
                              .get();
            if (stored)
            {
                return *stored;
            }
        }
        catch (const std::exception &e)
        {
            LABEL_LOG_WARN("Cannot read back print job {}: {}", started.id, e.what());
        }

        PrintJob job = started;
        job.completedAt = std::chrono::system_clock::now();
        job.errorCode = result.code;
        if (result.isSuccess())
        {
            job.status = PrintJobStatus::COMPLETED;
        }
        else
        {
            job.status = PrintJobStatus::FAILED;
            job.errorMessage = result.message;
        }
        return job;
    }
} // namespace llink
