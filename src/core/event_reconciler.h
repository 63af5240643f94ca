#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>
#include "core/core_event.h"
#include "core/device_registry.h"
#include "core/print_job_store.h"
#include "events/event_system.h"
#include "utils/thread_pool.h"

namespace llink
{
    /**
     * Event Reconciliation Layer
     *
     * Single serialized ingress for every asynchronous notification. Producers only post;
     * one worker applies events in arrival order to the Device Registry and the Print Job
     * store and publishes the resulting typed events on the EventBus.
     */
    class EventReconciler
    {
    public:
        using ConnectionStateProvider = std::function<ConnectionState()>;

        explicit EventReconciler(std::shared_ptr<EventBus> eventBus);
        ~EventReconciler();

        EventReconciler(const EventReconciler &) = delete;
        EventReconciler &operator=(const EventReconciler &) = delete;

        /**
         * Used by discoveryDone to re-query the connected state
         */
        void setConnectionStateProvider(ConnectionStateProvider provider);

        /**
         * Enqueue an event. Never blocks on event handling.
         * @return false if the reconciler is stopped
         */
        bool post(CoreEvent event);

        /**
         * Run a function on the serialization point and get its result.
         * Runs inline when already on the reconciler thread.
         * @throws std::runtime_error after stop()
         */
        template <typename F>
        auto submit(F &&func) -> std::future<std::invoke_result_t<F>>
        {
            using return_type = std::invoke_result_t<F>;
            if (executor_.isWorkerThread())
            {
                std::packaged_task<return_type()> task(std::forward<F>(func));
                auto result = task.get_future();
                task();
                return result;
            }
            return executor_.enqueue(std::forward<F>(func));
        }

        /**
         * Block until every event posted before this call has been applied
         */
        void drain();

        /**
         * Drain pending events and stop the worker
         */
        void stop();

        bool isStopped() const { return stopped_.load(); }

        // Read access, safe from any thread
        const DeviceRegistry &registry() const { return registry_; }
        const PrintJobStore &printJobs() const { return printJobs_; }

        /**
         * Latest session, std::nullopt before the first startDiscovery
         */
        std::optional<DiscoverySession> getCurrentSession() const;

        // Direct registry mutations requested by the facade, run on the serialization point
        bool removeDevice(const std::string &address);
        void clearDevices();

    private:
        void handle(const CoreEvent &event);

        void onDeviceListChanged(const std::vector<Device> &devices, const std::optional<std::string> &selected);
        void onConnectionChanged(const ConnectionState &state);
        void onDiscoveryStarted(const DiscoverySession &session);
        void onDiscoveryFinished(const CoreEvent &event);
        void onPrintResolved(const CoreEvent &event);
        void synchronizeConnectedDevice();
        void publishSession();
        void publishJob(const PrintJob &job);

        std::shared_ptr<EventBus> eventBus_;
        DeviceRegistry registry_;
        PrintJobStore printJobs_;
        ConnectionStateProvider connectionStateProvider_;

        // Owned by the reconciler thread
        bool pendingConnectedSync_ = false;

        mutable std::mutex sessionMutex_;
        std::optional<DiscoverySession> currentSession_;

        std::atomic<bool> stopped_{false};
        ThreadPool executor_;
    };
} // namespace llink
