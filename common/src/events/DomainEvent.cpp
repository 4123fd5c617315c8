#include "events/DomainEvent.hpp"
#include "domain/Uuid.hpp"

namespace monolith::events {

DomainEvent::DomainEvent(EventType eventType, std::string aggregateId)
    : eventId_(domain::generateUuid())
    , eventType_(std::move(eventType))
    , occurredAt_(domain::Timestamp::now())
    , aggregateId_(std::move(aggregateId))
{}

nlohmann::json DomainEvent::toJson() const {
    nlohmann::json j;
    j["event_id"] = eventId_;
    j["event_type"] = eventType_.str();
    j["occurred_at"] = occurredAt_.toString();
    j["aggregate_id"] = aggregateId_;
    return j;
}

} // namespace monolith::events
