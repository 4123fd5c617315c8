#pragma once

#include "events/EventType.hpp"
#include "events/IEventHandler.hpp"
#include <memory>

namespace monolith::events {

/**
 * @brief Порт подписки обработчиков на тип события
 *
 * Модули подписываются при старте приложения.
 */
class IEventSubscriber {
public:
    virtual ~IEventSubscriber() = default;

    /**
     * @throws std::invalid_argument если handler == nullptr
     */
    virtual void subscribe(const EventType& eventType, EventHandlerPtr handler) = 0;
};

/**
 * @brief Подписать функцию, принимающую конкретный тип события
 */
template <typename E>
void subscribeTyped(IEventSubscriber& subscriber,
                    const EventType& eventType,
                    typename TypedEventHandlerFunc<E>::Func func) {
    subscriber.subscribe(eventType, std::make_shared<TypedEventHandlerFunc<E>>(std::move(func)));
}

} // namespace monolith::events
