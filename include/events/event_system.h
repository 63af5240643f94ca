#pragma once

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <vector>
#include <memory>
#include <typeindex>
#include <string>
#include <mutex>
#include "label_export.h"

namespace llink
{
    /**
     * Base Event Class
     * All strongly-typed events should inherit from this class
     */
    class BaseEvent
    {
    public:
        virtual ~BaseEvent() = default;
    };

    /**
     * Event Handler Interface
     */
    class IEventHandler
    {
    public:
        virtual ~IEventHandler() = default;
        virtual void handleEvent(const std::shared_ptr<BaseEvent> &event) = 0;
    };

    /**
     * Strongly-Typed Event Handler Template
     */
    template <typename EventType>
    class TypedEventHandler : public IEventHandler
    {
    public:
        using HandlerFunc = std::function<void(const std::shared_ptr<EventType> &)>;

        explicit TypedEventHandler(HandlerFunc handler) : handler_(std::move(handler)) {}

        void handleEvent(const std::shared_ptr<BaseEvent> &event) override
        {
            auto typedEvent = std::dynamic_pointer_cast<EventType>(event);
            if (typedEvent && handler_)
            {
                handler_(typedEvent);
            }
        }

    private:
        HandlerFunc handler_;
    };

    /**
     * Event Bus
     * Responsible for event dispatching and subscription management.
     * Handlers run on the publishing thread, outside the bus lock.
     */
    class LABEL_LINK_API EventBus
    {
    public:
        using EventId = size_t;

        /**
         * Subscribe to a specific type of event
         */
        template <typename EventType>
        EventId subscribe(std::function<void(const std::shared_ptr<EventType> &)> handler)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            EventId id = nextId_++;

            auto typedHandler = std::make_shared<TypedEventHandler<EventType>>(std::move(handler));
            handlers_[std::type_index(typeid(EventType))].emplace_back(id, typedHandler);

            return id;
        }

        /**
         * Unsubscribe
         */
        template <typename EventType>
        bool unsubscribe(EventId id)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto &eventHandlers = handlers_[std::type_index(typeid(EventType))];

            auto it = std::find_if(eventHandlers.begin(), eventHandlers.end(),
                                   [id](const auto &pair)
                                   { return pair.first == id; });

            if (it != eventHandlers.end())
            {
                eventHandlers.erase(it);
                return true;
            }
            return false;
        }

        /**
         * Publish an event
         */
        template <typename EventType>
        void publish(std::shared_ptr<EventType> event)
        {
            std::vector<std::shared_ptr<IEventHandler>> snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = handlers_.find(std::type_index(typeid(EventType)));
                if (it == handlers_.end())
                {
                    return;
                }
                for (const auto &[id, handler] : it->second)
                {
                    snapshot.push_back(handler);
                }
            }

            std::shared_ptr<BaseEvent> baseEvent = event;
            for (const auto &handler : snapshot)
            {
                if (handler)
                {
                    dispatch(handler, baseEvent);
                }
            }
        }

        /**
         * Number of handlers subscribed to an event type
         */
        template <typename EventType>
        size_t subscriberCount() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            return it == handlers_.end() ? 0 : it->second.size();
        }

        /**
         * Clear all subscriptions
         */
        void clear();

    private:
        // Handler exceptions are logged and do not reach the publisher
        void dispatch(const std::shared_ptr<IEventHandler> &handler, const std::shared_ptr<BaseEvent> &event);

        mutable std::mutex mutex_;
        EventId nextId_ = 1;
        std::unordered_map<std::type_index, std::vector<std::pair<EventId, std::shared_ptr<IEventHandler>>>> handlers_;
    };

} // namespace llink
