#pragma once

#include <functional>
#include <memory>
#include <string>
#include "types/biz.h"
#include "types/device.h"
#include "types/discovery.h"

namespace llink
{
    /**
     * Callbacks a discovery source reports through. May be invoked from any thread,
     * including synchronously from start() or stop().
     */
    struct DiscoverySourceCallbacks
    {
        std::function<void(const Device &)> onFound;
        std::function<void(const Device &)> onGone;
        std::function<void()> onFinished;
        std::function<void(DiscoveryErrorKind, const std::string &)> onError;
    };

    /**
     * One independent mechanism for finding printers.
     *
     * stop() has the same contract for every source: after it returns the source may
     * still report, but the coordinator discards anything it reports for that run.
     * Sources that can cancel their work physically do so; others only mark the run inactive.
     */
    class IDiscoverySource
    {
    public:
        virtual ~IDiscoverySource() = default;

        virtual std::string getName() const = 0;

        /**
         * Checked before any source is started.
         * @return PERMISSION_DENIED to refuse the whole session
         */
        virtual VoidResult checkPermission() { return VoidResult::Success(); }

        /**
         * Begin a run. Failures are reported through callbacks.onError.
         */
        virtual void start(const DiscoverySourceCallbacks &callbacks) = 0;

        virtual void stop() = 0;

        /**
         * Whether stop() cancels the underlying work
         */
        virtual bool isStoppable() const = 0;
    };

    using DiscoverySourcePtr = std::shared_ptr<IDiscoverySource>;

} // namespace llink
