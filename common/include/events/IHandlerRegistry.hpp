#pragma once

#include "events/EventType.hpp"
#include "events/IEventHandler.hpp"
#include <vector>

namespace monolith::events {

/**
 * @brief Порт чтения реестра обработчиков
 */
class IHandlerRegistry {
public:
    virtual ~IHandlerRegistry() = default;

    /**
     * @brief Обработчики типа события в порядке подписки
     * @return Копия списка: изменения реестра после вызова на неё не влияют
     */
    virtual std::vector<EventHandlerPtr> handlersFor(const EventType& eventType) const = 0;
};

} // namespace monolith::events
