#include "core/event_reconciler.h"
#include "types/event.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <stdexcept>

namespace llink
{
    namespace
    {
        StatusSeverity severityForPhase(ConnectionPhase phase)
        {
            switch (phase)
            {
            case ConnectionPhase::CONNECTING:
                return StatusSeverity::CONNECTING;
            case ConnectionPhase::CONNECTED:
                return StatusSeverity::CONNECTED;
            default:
                return StatusSeverity::DISCONNECTED;
            }
        }
    }

    EventReconciler::EventReconciler(std::shared_ptr<EventBus> eventBus)
        : eventBus_(std::move(eventBus)),
          executor_(1, 0, ThreadPool::RejectionPolicy::BLOCK)
    {
        registry_.setChangeCallback([this](const std::vector<Device> &devices, const std::optional<std::string> &selected)
                                    { onDeviceListChanged(devices, selected); });
    }

    EventReconciler::~EventReconciler()
    {
        stop();
    }

    void EventReconciler::setConnectionStateProvider(ConnectionStateProvider provider)
    {
        connectionStateProvider_ = std::move(provider);
    }

    bool EventReconciler::post(CoreEvent event)
    {
        if (stopped_.load())
        {
            LABEL_LOG_DEBUG("Reconciler stopped, dropping {} event", coreEventTypeToString(event.type));
            return false;
        }

        CoreEventType type = event.type;
        try
        {
            executor_.enqueue([this, event = std::move(event)]()
                              { handle(event); });
            return true;
        }
        catch (const std::runtime_error &e)
        {
            LABEL_LOG_WARN("Failed to enqueue {} event: {}", coreEventTypeToString(type), e.what());
            return false;
        }
    }

    void EventReconciler::drain()
    {
        if (executor_.isWorkerThread())
        {
            return;
        }
        try
        {
            submit([] {}).get();
        }
        catch (const std::runtime_error &e)
        {
            LABEL_LOG_DEBUG("Drain skipped: {}", e.what());
        }
    }

    void EventReconciler::stop()
    {
        stopped_ = true;
        executor_.shutdown();
    }

    std::optional<DiscoverySession> EventReconciler::getCurrentSession() const
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        return currentSession_;
    }

    bool EventReconciler::removeDevice(const std::string &address)
    {
        return submit([this, address]()
                      { return registry_.remove(address); })
            .get();
    }

    void EventReconciler::clearDevices()
    {
        submit([this]()
               { registry_.clear(); })
            .get();
    }

    void EventReconciler::handle(const CoreEvent &event)
    {
        LABEL_LOG_TRACE("Reconciling {} event", coreEventTypeToString(event.type));

        switch (event.type)
        {
        case CoreEventType::PRINTER_FOUND:
            registry_.add(event.device);
            break;

        case CoreEventType::PRINTER_REMOVED:
            registry_.remove(event.address);
            break;

        case CoreEventType::STATUS_CHANGED:
            registry_.updateSelectedStatus(event.statusText, event.severity);
            break;

        case CoreEventType::CONNECTION_CHANGED:
            onConnectionChanged(event.connection);
            break;

        case CoreEventType::DISCOVERY_STARTED:
            onDiscoveryStarted(event.session);
            break;

        case CoreEventType::DISCOVERY_DONE:
        case CoreEventType::DISCOVERY_ERROR:
            onDiscoveryFinished(event);
            break;

        case CoreEventType::PERMISSION_DENIED:
            eventBus_->publish(std::make_shared<PermissionDeniedEvent>());
            break;

        case CoreEventType::SYNC_REQUESTED:
            pendingConnectedSync_ = true;
            break;

        case CoreEventType::PRINT_STARTED:
        {
            if (!printJobs_.add(event.job))
            {
                LABEL_LOG_ERROR("Print job {} already exists", event.job.id);
                break;
            }
            if (auto queued = printJobs_.get(event.job.id))
            {
                publishJob(*queued);
            }
            if (auto printing = printJobs_.markPrinting(event.job.id))
            {
                publishJob(*printing);
            }
            break;
        }

        case CoreEventType::PRINT_COMPLETE:
        case CoreEventType::PRINT_ERROR:
            onPrintResolved(event);
            break;

        case CoreEventType::CANCEL_PRINT_JOBS:
            for (const auto &job : printJobs_.cancelActive(event.message))
            {
                publishJob(job);
            }
            break;

        default:
            LABEL_LOG_DEBUG("Unhandled core event type: {}", static_cast<int>(event.type));
            break;
        }
    }

    void EventReconciler::onDeviceListChanged(const std::vector<Device> &devices, const std::optional<std::string> &selected)
    {
        auto listEvent = std::make_shared<DeviceListChangedEvent>();
        listEvent->devices = devices;
        listEvent->selectedAddress = selected;
        eventBus_->publish(listEvent);

        bool scanning = false;
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            if (currentSession_ && currentSession_->status == DiscoveryStatus::SCANNING)
            {
                currentSession_->devices = devices;
                scanning = true;
            }
        }
        if (scanning)
        {
            publishSession();
        }
    }

    void EventReconciler::onConnectionChanged(const ConnectionState &state)
    {
        auto severity = severityForPhase(state.phase);
        auto text = connectionPhaseToString(state.phase);

        switch (state.phase)
        {
        case ConnectionPhase::CONNECTING:
        case ConnectionPhase::CONNECTED:
            registry_.select(state.address);
            registry_.updateSelectedStatus(text, severity);
            break;
        case ConnectionPhase::DISCONNECTING:
            registry_.updateSelectedStatus(text, severity);
            break;
        case ConnectionPhase::DISCONNECTED:
            registry_.updateSelectedStatus(text, severity);
            registry_.select(std::nullopt);
            break;
        }

        if (state.phase == ConnectionPhase::CONNECTED)
        {
            // A connect that lands mid-scan is confirmed once the scan settles
            std::lock_guard<std::mutex> lock(sessionMutex_);
            if (currentSession_ && currentSession_->status == DiscoveryStatus::SCANNING)
            {
                pendingConnectedSync_ = true;
            }
        }

        auto stateEvent = std::make_shared<ConnectionStateEvent>();
        stateEvent->state = state;
        eventBus_->publish(stateEvent);
    }

    void EventReconciler::onDiscoveryStarted(const DiscoverySession &session)
    {
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            currentSession_ = session;
        }

        size_t dropped = registry_.removeDisconnected();
        if (dropped > 0)
        {
            LABEL_LOG_DEBUG("Dropped {} disconnected devices before discovery", dropped);
        }

        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            currentSession_->devices = registry_.getDevices();
        }
        publishSession();
    }

    void EventReconciler::onDiscoveryFinished(const CoreEvent &event)
    {
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            if (!currentSession_ || currentSession_->id != event.session.id)
            {
                LABEL_LOG_WARN("Ignoring terminal event for stale session {}", event.session.id);
                return;
            }
        }

        if (pendingConnectedSync_)
        {
            synchronizeConnectedDevice();
        }

        DiscoverySession session = event.session;
        session.devices = registry_.getDevices();
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            currentSession_ = session;
        }
        publishSession();

        if (session.status == DiscoveryStatus::ERROR_STATE)
        {
            auto errorEvent = std::make_shared<DiscoveryErrorEvent>();
            errorEvent->sessionId = session.id;
            errorEvent->kind = session.errorKind;
            errorEvent->message = session.errorMessage.value_or("");
            eventBus_->publish(errorEvent);
        }
    }

    void EventReconciler::synchronizeConnectedDevice()
    {
        pendingConnectedSync_ = false;
        if (!connectionStateProvider_)
        {
            return;
        }

        ConnectionState state = connectionStateProvider_();
        if (!state.isConnected() || !state.address)
        {
            return;
        }

        registry_.select(state.address);
        if (registry_.synchronizeSelected(connectionPhaseToString(ConnectionPhase::CONNECTED)))
        {
            LABEL_LOG_INFO("Synchronized connected device {} after discovery", StringUtils::maskString(*state.address));
        }
    }

    void EventReconciler::onPrintResolved(const CoreEvent &event)
    {
        auto code = event.type == CoreEventType::PRINT_COMPLETE ? LLINK_ERROR_CODE::SUCCESS : event.errorCode;
        if (event.type == CoreEventType::PRINT_ERROR && code == LLINK_ERROR_CODE::SUCCESS)
        {
            code = LLINK_ERROR_CODE::UNKNOWN_ERROR;
        }

        auto job = printJobs_.resolve(event.jobId, code, event.message);
        if (!job)
        {
            LABEL_LOG_WARN("{} arrived with no job in flight", coreEventTypeToString(event.type));
            return;
        }

        LABEL_LOG_INFO("Print job {} {}", job->id, printJobStatusToString(job->status));
        publishJob(*job);
    }

    void EventReconciler::publishSession()
    {
        auto sessionEvent = std::make_shared<DiscoverySessionEvent>();
        {
            std::lock_guard<std::mutex> lock(sessionMutex_);
            if (!currentSession_)
            {
                return;
            }
            sessionEvent->session = *currentSession_;
        }
        eventBus_->publish(sessionEvent);
    }

    void EventReconciler::publishJob(const PrintJob &job)
    {
        auto jobEvent = std::make_shared<PrintJobEvent>();
        jobEvent->job = job;
        eventBus_->publish(jobEvent);
    }
} // namespace llink
