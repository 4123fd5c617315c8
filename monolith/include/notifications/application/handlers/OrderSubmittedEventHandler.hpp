#pragma once

#include "notifications/ports/output/INotificationSender.hpp"
#include "events/IEventHandler.hpp"
#include "events/contracts/OrderEvents.hpp"
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace monolith::notifications::application::handlers {

/**
 * @brief Подтверждение заказа пользователю
 *
 * Подписан на orders.OrderSubmitted в post-commit шине.
 * Повторная доставка того же события (тот же eventId) пропускается.
 * Помнит не более capacity последних eventId, старейшие вытесняются.
 */
class OrderSubmittedEventHandler : public events::TypedEventHandler<events::contracts::OrderSubmittedEvent> {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10000;

    explicit OrderSubmittedEventHandler(std::shared_ptr<ports::output::INotificationSender> sender,
                                        size_t capacity = DEFAULT_CAPACITY)
        : sender_(std::move(sender))
        , capacity_(capacity)
    {
        if (!sender_) {
            throw std::invalid_argument("OrderSubmittedEventHandler requires a notification sender");
        }
        if (capacity_ == 0) {
            throw std::invalid_argument("OrderSubmittedEventHandler capacity must be positive");
        }
    }

    size_t processedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return processed_.size();
    }

protected:
    void handleEvent(const Context&, const events::contracts::OrderSubmittedEvent& event) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (processed_.count(event.eventId()) > 0) {
                std::cout << "[OrderSubmittedEventHandler] Duplicate event " << event.eventId()
                          << ", skipping" << std::endl;
                return;
            }
        }

        ports::output::Notification notification;
        notification.recipientId = event.userId();
        notification.subject = "Order submitted";
        notification.body = "Your order " + event.orderId() + " for " +
            std::to_string(event.totalAmount()) + " " + event.currency() + " has been submitted";

        sender_->send(notification);

        // Событие отмечается обработанным только после успешной отправки
        std::lock_guard<std::mutex> lock(mutex_);
        if (!processed_.insert(event.eventId()).second) {
            return;
        }
        order_.push_back(event.eventId());
        if (order_.size() > capacity_) {
            processed_.erase(order_.front());
            order_.pop_front();
        }
    }

private:
    std::shared_ptr<ports::output::INotificationSender> sender_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> processed_;
    std::deque<std::string> order_;   ///< Порядок вставки для вытеснения
};

} // namespace monolith::notifications::application::handlers
