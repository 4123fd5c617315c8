#pragma once

#include "events/DomainEvent.hpp"
#include <vector>

namespace monolith::domain {

/**
 * @brief Базовый класс корня агрегата
 *
 * Собирает доменные события, порождённые бизнес-методами.
 * Добавлять события может только сам агрегат (addDomainEvent защищён),
 * забирает их сервис приложения после сохранения.
 */
class AggregateRoot {
public:
    virtual ~AggregateRoot() = default;

    /// События, ожидающие публикации, в порядке возникновения
    const std::vector<events::DomainEventPtr>& domainEvents() const {
        return domainEvents_;
    }

    void clearDomainEvents() {
        domainEvents_.clear();
    }

    /**
     * @brief Забрать накопленные события и очистить список
     *
     * Повторный вызов без новых бизнес-операций вернёт пустой список.
     */
    std::vector<events::DomainEventPtr> popDomainEvents() {
        std::vector<events::DomainEventPtr> events;
        events.swap(domainEvents_);
        return events;
    }

protected:
    void addDomainEvent(events::DomainEventPtr event) {
        domainEvents_.push_back(std::move(event));
    }

private:
    std::vector<events::DomainEventPtr> domainEvents_;
};

} // namespace monolith::domain
