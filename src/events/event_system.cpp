#include "events/event_system.h"
#include "utils/logger.h"

namespace llink
{

    void EventBus::clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.clear();
    }

    void EventBus::dispatch(const std::shared_ptr<IEventHandler> &handler, const std::shared_ptr<BaseEvent> &event)
    {
        try
        {
            handler->handleEvent(event);
        }
        catch (const std::exception &e)
        {
            LABEL_LOG_ERROR("Event handler threw: {}", e.what());
        }
    }

} // namespace llink
