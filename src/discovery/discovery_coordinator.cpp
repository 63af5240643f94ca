#include "discovery/discovery_coordinator.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace llink
{
    DiscoveryCoordinator::DiscoveryCoordinator(const LabelDiscoveryConfig &config, EventSink sink)
        : config_(config), sink_(std::move(sink)), gate_(std::make_shared<CallbackGate>())
    {
        gate_->owner = this;
    }

    DiscoveryCoordinator::~DiscoveryCoordinator()
    {
        shutdown();
    }

    void DiscoveryCoordinator::addSource(DiscoverySourcePtr source)
    {
        if (!source)
        {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        LABEL_LOG_DEBUG("Discovery source registered: {}", source->getName());
        sources_.push_back(std::move(source));
    }

    size_t DiscoveryCoordinator::sourceCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sources_.size();
    }

    bool DiscoveryCoordinator::isScanning() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_ && !current_->finalized;
    }

    BizResult<DiscoverySession> DiscoveryCoordinator::startDiscovery()
    {
        std::vector<DiscoverySourcePtr> sources;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (starting_ || (current_ && !current_->finalized))
            {
                LABEL_LOG_WARN("Discovery already running");
                return BizResult<DiscoverySession>::Error(LLINK_ERROR_CODE::DISCOVERY_ALREADY_RUNNING,
                                                          "Discovery is already running");
            }
            if (sources_.empty())
            {
                LABEL_LOG_ERROR("No discovery sources configured");
                return BizResult<DiscoverySession>::Error(LLINK_ERROR_CODE::DISCOVERY_FAILED,
                                                          "No discovery sources configured");
            }
            starting_ = true;
            sources = sources_;
        }

        for (const auto &source : sources)
        {
            VoidResult permission = source->checkPermission();
            if (permission.isSuccess())
            {
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                starting_ = false;
            }
            if (permission.code == LLINK_ERROR_CODE::PERMISSION_DENIED)
            {
                LABEL_LOG_WARN("Discovery not started: {} source permission denied", source->getName());
                emit(CoreEvent::permissionDenied());
            }
            else
            {
                LABEL_LOG_ERROR("Discovery not started: {} source unavailable: {}", source->getName(), permission.message);
            }
            return BizResult<DiscoverySession>(permission);
        }

        auto state = std::make_shared<SessionState>();
        state->session.id = IdUtils::generateId("discovery");
        state->session.status = DiscoveryStatus::SCANNING;
        state->session.startedAt = std::chrono::system_clock::now();
        for (const auto &source : sources)
        {
            SourceSlot slot;
            slot.source = source;
            state->slots.push_back(slot);
        }
        state->activeSources = static_cast<int>(state->slots.size());

        DiscoverySession started = state->session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_ = state;
            starting_ = false;
            emit(CoreEvent::discovery(CoreEventType::DISCOVERY_STARTED, started));
        }
        LABEL_LOG_INFO("Discovery session {} started with {} sources", started.id, state->slots.size());

        armWatchdog(state);

        for (size_t i = 0; i < state->slots.size(); ++i)
        {
            try
            {
                state->slots[i].source->start(makeCallbacks(state, i));
            }
            catch (const std::exception &e)
            {
                LABEL_LOG_ERROR("Discovery source {} failed to start: {}", state->slots[i].source->getName(), e.what());
                onSourceEnded(state, i, true, DiscoveryErrorKind::GENERAL, e.what());
            }
        }

        return BizResult<DiscoverySession>::Ok(started);
    }

    VoidResult DiscoveryCoordinator::stopDiscovery()
    {
        std::shared_ptr<SessionState> state;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!current_ || current_->finalized)
            {
                LABEL_LOG_DEBUG("stopDiscovery: no active session");
                return VoidResult::Success();
            }
            state = current_;
            emit(CoreEvent::syncRequested());
            emit(finalizeLocked(state, DiscoveryStatus::COMPLETED, "", DiscoveryErrorKind::NONE));
        }
        LABEL_LOG_INFO("Discovery session {} stopped", state->session.id);

        cancelWatchdog(state);
        stopSources(state);
        return VoidResult::Success();
    }

    void DiscoveryCoordinator::shutdown()
    {
        VoidResult stopped = stopDiscovery();
        if (!stopped.isSuccess())
        {
            LABEL_LOG_WARN("Failed to stop discovery during shutdown: {}", stopped.message);
        }

        {
            std::lock_guard<std::mutex> lock(gate_->mutex);
            gate_->owner = nullptr;
        }

        std::lock_guard<std::mutex> lock(watchdogThreadMutex_);
        cancelWatchdog(watchdogState_);
        joinWatchdogLocked();
        watchdogState_.reset();
    }

    // ========== Source callbacks ==========

    DiscoverySourceCallbacks DiscoveryCoordinator::makeCallbacks(const std::shared_ptr<SessionState> &state, size_t index)
    {
        auto gate = gate_;
        DiscoverySourceCallbacks callbacks;
        callbacks.onFound = [gate, state, index](const Device &device)
        {
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (gate->owner)
            {
                gate->owner->onSourceFound(state, index, device);
            }
        };
        callbacks.onGone = [gate, state, index](const Device &device)
        {
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (gate->owner)
            {
                gate->owner->onSourceGone(state, index, device);
            }
        };
        callbacks.onFinished = [gate, state, index]()
        {
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (gate->owner)
            {
                gate->owner->onSourceEnded(state, index, false, DiscoveryErrorKind::NONE, "");
            }
        };
        callbacks.onError = [gate, state, index](DiscoveryErrorKind kind, const std::string &message)
        {
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (gate->owner)
            {
                gate->owner->onSourceEnded(state, index, true, kind, message);
            }
        };
        return callbacks;
    }

    bool DiscoveryCoordinator::isLiveLocked(const std::shared_ptr<SessionState> &state, size_t index) const
    {
        return state == current_ && !state->finalized &&
               index < state->slots.size() && state->slots[index].active;
    }

    void DiscoveryCoordinator::onSourceFound(const std::shared_ptr<SessionState> &state, size_t index, const Device &device)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isLiveLocked(state, index) || device.address.empty())
        {
            return;
        }
        if (!state->announced.insert(device.address).second)
        {
            return;
        }
        ++state->foundCount;
        LABEL_LOG_DEBUG("Device found by {}: {}", state->slots[index].source->getName(),
                        StringUtils::maskString(device.address));
        emit(CoreEvent::printerFound(device));
    }

    void DiscoveryCoordinator::onSourceGone(const std::shared_ptr<SessionState> &state, size_t index, const Device &device)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isLiveLocked(state, index))
        {
            return;
        }
        state->announced.erase(device.address);
        LABEL_LOG_DEBUG("Device out of range: {}", StringUtils::maskString(device.address));
        emit(CoreEvent::printerRemoved(device.address));
    }

    void DiscoveryCoordinator::onSourceEnded(const std::shared_ptr<SessionState> &state, size_t index,
                                             bool failed, DiscoveryErrorKind kind, const std::string &message)
    {
        bool ended = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!isLiveLocked(state, index))
            {
                return;
            }
            state->slots[index].active = false;
            --state->activeSources;

            if (failed)
            {
                LABEL_LOG_WARN("Discovery source {} failed: {}", state->slots[index].source->getName(), message);
                if (!state->anyError)
                {
                    state->session.errorMessage = message;
                    state->session.errorKind = kind;
                }
                state->anyError = true;
            }
            else
            {
                LABEL_LOG_DEBUG("Discovery source {} finished", state->slots[index].source->getName());
            }

            if (state->activeSources <= 0)
            {
                if (state->anyError)
                {
                    emit(finalizeLocked(state, DiscoveryStatus::ERROR_STATE,
                                        state->session.errorMessage.value_or(""), state->session.errorKind));
                }
                else
                {
                    emit(finalizeLocked(state, DiscoveryStatus::COMPLETED, "", DiscoveryErrorKind::NONE));
                }
                ended = true;
            }
        }

        if (ended)
        {
            cancelWatchdog(state);
        }
    }

    void DiscoveryCoordinator::onTimeout(const std::shared_ptr<SessionState> &state)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state != current_ || state->finalized)
            {
                return;
            }
            if (state->foundCount > 0)
            {
                LABEL_LOG_INFO("Discovery session {} reached its timeout with {} devices",
                               state->session.id, state->foundCount);
                emit(finalizeLocked(state, DiscoveryStatus::COMPLETED, "", DiscoveryErrorKind::NONE));
            }
            else
            {
                LABEL_LOG_WARN("Discovery session {} timed out without devices", state->session.id);
                emit(finalizeLocked(state, DiscoveryStatus::ERROR_STATE, timeoutMessage(), DiscoveryErrorKind::GENERAL));
            }
        }
        stopSources(state);
    }

    CoreEvent DiscoveryCoordinator::finalizeLocked(const std::shared_ptr<SessionState> &state, DiscoveryStatus status,
                                                   const std::string &errorMessage, DiscoveryErrorKind kind)
    {
        state->finalized = true;
        for (auto &slot : state->slots)
        {
            slot.active = false;
        }
        state->activeSources = 0;

        DiscoverySession &session = state->session;
        session.status = status;
        session.completedAt = std::chrono::system_clock::now();
        if (status == DiscoveryStatus::ERROR_STATE)
        {
            session.errorMessage = errorMessage;
            session.errorKind = kind;
        }
        else
        {
            session.errorMessage.reset();
            session.errorKind = DiscoveryErrorKind::NONE;
        }

        LABEL_LOG_INFO("Discovery session {} ended: {}", session.id, discoveryStatusToString(status));
        return CoreEvent::discovery(status == DiscoveryStatus::COMPLETED ? CoreEventType::DISCOVERY_DONE
                                                                         : CoreEventType::DISCOVERY_ERROR,
                                    session);
    }

    void DiscoveryCoordinator::stopSources(const std::shared_ptr<SessionState> &state)
    {
        // Slots are fixed after the session is created
        for (const auto &slot : state->slots)
        {
            try
            {
                slot.source->stop();
            }
            catch (const std::exception &e)
            {
                LABEL_LOG_ERROR("Failed to stop discovery source {}: {}", slot.source->getName(), e.what());
            }
        }
    }

    // ========== Watchdog ==========

    void DiscoveryCoordinator::armWatchdog(const std::shared_ptr<SessionState> &state)
    {
        std::lock_guard<std::mutex> lock(watchdogThreadMutex_);
        // The previous session is already final
        cancelWatchdog(watchdogState_);
        joinWatchdogLocked();
        watchdogState_ = state;
        watchdog_ = std::thread(&DiscoveryCoordinator::watchdogThread, this, state);
    }

    void DiscoveryCoordinator::cancelWatchdog(const std::shared_ptr<SessionState> &state)
    {
        if (!state)
        {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(watchdogMutex_);
            state->watchdogCancelled = true;
        }
        watchdogCv_.notify_all();
    }

    void DiscoveryCoordinator::joinWatchdogLocked()
    {
        if (!watchdog_.joinable())
        {
            return;
        }
        if (watchdog_.get_id() == std::this_thread::get_id())
        {
            watchdog_.detach();
            return;
        }
        watchdog_.join();
    }

    void DiscoveryCoordinator::watchdogThread(std::shared_ptr<SessionState> state)
    {
        bool cancelled = false;
        {
            std::unique_lock<std::mutex> lock(watchdogMutex_);
            cancelled = watchdogCv_.wait_for(lock, std::chrono::milliseconds(config_.timeoutMs),
                                             [&state]
                                             { return state->watchdogCancelled; });
        }
        if (!cancelled)
        {
            onTimeout(state);
        }
    }

    std::string DiscoveryCoordinator::timeoutMessage() const
    {
        return "Discovery timed out after " + TimeUtils::formatDuration(config_.timeoutMs) + ": no devices found";
    }

    bool DiscoveryCoordinator::emit(CoreEvent event)
    {
        if (!sink_)
        {
            return false;
        }
        try
        {
            return sink_(std::move(event));
        }
        catch (const std::exception &e)
        {
            LABEL_LOG_ERROR("Failed to forward discovery event: {}", e.what());
            return false;
        }
    }
} // namespace llink
