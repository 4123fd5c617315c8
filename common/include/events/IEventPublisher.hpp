#pragma once

#include "Context.hpp"
#include "events/DomainEvent.hpp"

namespace monolith::events {

/**
 * @brief Порт публикации доменных событий
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @throws std::invalid_argument если event == nullptr
     */
    virtual void publish(const Context& ctx, DomainEventPtr event) = 0;
};

/**
 * @brief Дочерний контекст с активным publisher'ом
 *
 * Указатель не владеющий: контекст действителен, пока жив publisher.
 */
Context withEventPublisher(const Context& ctx, IEventPublisher* publisher);

/**
 * @brief Publisher, активный для текущего обработчика, или nullptr
 *
 * Транзакционная шина кладёт себя в контекст на время вызова
 * обработчиков, чтобы они могли публиковать последующие события
 * в ту же очередь.
 */
IEventPublisher* publisherFromContext(const Context& ctx);

} // namespace monolith::events
