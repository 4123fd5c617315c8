#pragma once

#include "events/DomainEvent.hpp"
#include "events/contracts/OrderEvents.hpp"
#include <string>

namespace monolith::orders::domain {

using OrderSubmittedEvent = events::contracts::OrderSubmittedEvent;

/**
 * @brief Событие жизненного цикла заказа с идентификаторами заказа и пользователя
 */
class OrderLifecycleEvent : public events::DomainEvent {
public:
    const std::string& orderId() const { return orderId_; }
    const std::string& userId() const { return userId_; }

    nlohmann::json toJson() const override {
        auto j = DomainEvent::toJson();
        j["order_id"] = orderId_;
        j["user_id"] = userId_;
        return j;
    }

protected:
    OrderLifecycleEvent(const events::EventType& type, std::string orderId, std::string userId)
        : DomainEvent(type, orderId)
        , orderId_(std::move(orderId))
        , userId_(std::move(userId))
    {}

private:
    std::string orderId_;
    std::string userId_;
};

class OrderCreatedEvent : public OrderLifecycleEvent {
public:
    OrderCreatedEvent(std::string orderId, std::string userId)
        : OrderLifecycleEvent(events::contracts::ORDER_CREATED, std::move(orderId), std::move(userId)) {}
};

class OrderCancelledEvent : public OrderLifecycleEvent {
public:
    OrderCancelledEvent(std::string orderId, std::string userId)
        : OrderLifecycleEvent(events::contracts::ORDER_CANCELLED, std::move(orderId), std::move(userId)) {}
};

} // namespace monolith::orders::domain
