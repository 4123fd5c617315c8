#pragma once

#include "events/EventType.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace monolith::events {

/**
 * @brief Базовый класс доменного события
 *
 * Неизменяемо после создания: только геттеры.
 * eventId и occurredAt назначаются при конструировании.
 * Конкретные события наследуются и добавляют полезную нагрузку.
 */
class DomainEvent {
public:
    virtual ~DomainEvent() = default;

    const std::string& eventId() const { return eventId_; }
    const EventType& eventType() const { return eventType_; }
    const domain::Timestamp& occurredAt() const { return occurredAt_; }
    const std::string& aggregateId() const { return aggregateId_; }

    /**
     * @brief Сериализовать событие в JSON
     *
     * Базовая реализация пишет event_id, event_type, occurred_at,
     * aggregate_id. Наследники дополняют своими полями.
     */
    virtual nlohmann::json toJson() const;

protected:
    DomainEvent(EventType eventType, std::string aggregateId);

private:
    std::string eventId_;
    EventType eventType_;
    domain::Timestamp occurredAt_;
    std::string aggregateId_;
};

using DomainEventPtr = std::shared_ptr<const DomainEvent>;

} // namespace monolith::events
