#pragma once

#include "events/DomainEvent.hpp"
#include <cstdint>
#include <string>

/**
 * @file OrderEvents.hpp
 * @brief Публичный контракт событий модуля orders
 */

namespace monolith::events::contracts {

inline const EventType ORDER_CREATED{"orders.OrderCreated"};
inline const EventType ORDER_SUBMITTED{"orders.OrderSubmitted"};
inline const EventType ORDER_CANCELLED{"orders.OrderCancelled"};

/**
 * @brief Заказ отправлен на обработку
 */
class OrderSubmittedEvent : public DomainEvent {
public:
    OrderSubmittedEvent(std::string orderId, std::string userId, int64_t totalAmount, std::string currency)
        : DomainEvent(ORDER_SUBMITTED, orderId)
        , orderId_(std::move(orderId))
        , userId_(std::move(userId))
        , totalAmount_(totalAmount)
        , currency_(std::move(currency))
    {}

    const std::string& orderId() const { return orderId_; }
    const std::string& userId() const { return userId_; }
    int64_t totalAmount() const { return totalAmount_; }    ///< В минорных единицах
    const std::string& currency() const { return currency_; }

    nlohmann::json toJson() const override {
        auto j = DomainEvent::toJson();
        j["order_id"] = orderId_;
        j["user_id"] = userId_;
        j["total_amount"] = totalAmount_;
        j["currency"] = currency_;
        return j;
    }

private:
    std::string orderId_;
    std::string userId_;
    int64_t totalAmount_;
    std::string currency_;
};

} // namespace monolith::events::contracts
