#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
#include "config.h"
#include "core/core_event.h"
#include "platform/discovery_source.h"

namespace llink
{
    /**
     * Runs every configured discovery source concurrently and merges their results.
     *
     * Findings are deduplicated per session, forwarded as core events, and the session
     * reaches exactly one terminal state: all sources finished, global timeout, or
     * stopDiscovery(). Source callbacks are filtered once their session is over.
     */
    class DiscoveryCoordinator
    {
    public:
        using EventSink = std::function<bool(CoreEvent)>;

        DiscoveryCoordinator(const LabelDiscoveryConfig &config, EventSink sink);
        ~DiscoveryCoordinator();

        DiscoveryCoordinator(const DiscoveryCoordinator &) = delete;
        DiscoveryCoordinator &operator=(const DiscoveryCoordinator &) = delete;

        void addSource(DiscoverySourcePtr source);
        size_t sourceCount() const;

        /**
         * Start a new session
         * @return the SCANNING session, DISCOVERY_ALREADY_RUNNING or PERMISSION_DENIED
         */
        BizResult<DiscoverySession> startDiscovery();

        /**
         * End the active session as COMPLETED. No-op without one.
         */
        VoidResult stopDiscovery();

        bool isScanning() const;

        /**
         * Stop the active session and release every source
         */
        void shutdown();

    private:
        struct SourceSlot
        {
            DiscoverySourcePtr source;
            bool active = true;
        };

        struct SessionState
        {
            DiscoverySession session;
            std::vector<SourceSlot> slots;
            int activeSources = 0;
            std::unordered_set<std::string> announced;
            size_t foundCount = 0;
            bool anyError = false;
            bool finalized = false;
            bool watchdogCancelled = false; // guarded by watchdogMutex_
        };

        // Guards source callbacks against a coordinator that is shutting down
        struct CallbackGate
        {
            std::mutex mutex;
            DiscoveryCoordinator *owner = nullptr;
        };

        DiscoverySourceCallbacks makeCallbacks(const std::shared_ptr<SessionState> &state, size_t index);

        void onSourceFound(const std::shared_ptr<SessionState> &state, size_t index, const Device &device);
        void onSourceGone(const std::shared_ptr<SessionState> &state, size_t index, const Device &device);
        void onSourceEnded(const std::shared_ptr<SessionState> &state, size_t index,
                           bool failed, DiscoveryErrorKind kind, const std::string &message);
        void onTimeout(const std::shared_ptr<SessionState> &state);

        bool isLiveLocked(const std::shared_ptr<SessionState> &state, size_t index) const;
        CoreEvent finalizeLocked(const std::shared_ptr<SessionState> &state, DiscoveryStatus status,
                                 const std::string &errorMessage, DiscoveryErrorKind kind);
        void stopSources(const std::shared_ptr<SessionState> &state);

        void armWatchdog(const std::shared_ptr<SessionState> &state);
        void cancelWatchdog(const std::shared_ptr<SessionState> &state);
        void joinWatchdogLocked();
        void watchdogThread(std::shared_ptr<SessionState> state);

        std::string timeoutMessage() const;
        bool emit(CoreEvent event);

        LabelDiscoveryConfig config_;
        EventSink sink_;

        mutable std::mutex mutex_;
        std::shared_ptr<SessionState> current_;
        bool starting_ = false;

        std::shared_ptr<CallbackGate> gate_;

        std::mutex watchdogMutex_;
        std::condition_variable watchdogCv_;

        // Guards watchdog_ and watchdogState_
        std::mutex watchdogThreadMutex_;
        std::thread watchdog_;
        std::shared_ptr<SessionState> watchdogState_;

        // Declared last, released first
        std::vector<DiscoverySourcePtr> sources_;
    };
} // namespace llink
