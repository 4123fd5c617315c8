#pragma once

#include "orders/ports/output/IOrderRepository.hpp"
#include "events/IEventHandler.hpp"
#include "events/IEventPublisher.hpp"
#include "events/contracts/UserEvents.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

namespace monolith::orders::application::handlers {

/**
 * @brief Отмена открытых заказов удалённого пользователя
 *
 * Подписан на users.UserDeleted в транзакционном реестре и выполняется
 * в транзакции удаления: заказы читаются и сохраняются через контекст,
 * поэтому удаление пользователя и отмена заказов фиксируются вместе.
 * Ошибка сохранения откатывает всю команду.
 */
class UserDeletedEventHandler : public events::TypedEventHandler<events::contracts::UserDeletedEvent> {
public:
    static constexpr int MAX_ORDERS_PER_USER = 1000;

    explicit UserDeletedEventHandler(std::shared_ptr<ports::output::IOrderRepository> orderRepository)
        : orderRepository_(std::move(orderRepository))
    {
        if (!orderRepository_) {
            throw std::invalid_argument("UserDeletedEventHandler requires an order repository");
        }
    }

protected:
    void handleEvent(const Context& ctx, const events::contracts::UserDeletedEvent& event) override {
        auto userRef = domain::UserRef::parse(event.userId());
        auto [orders, total] = orderRepository_->findByUserRef(ctx, userRef, 0, MAX_ORDERS_PER_USER);

        auto* publisher = events::publisherFromContext(ctx);
        int cancelled = 0;

        for (auto& order : orders) {
            if (!domain::isOpenStatus(order.status())) {
                continue;
            }
            try {
                order.cancel();
            } catch (const monolith::domain::DomainException& e) {
                std::cerr << "[UserDeletedEventHandler] Skipping order " << order.id().value()
                          << ": " << e.getCode() << " " << e.what() << std::endl;
                continue;
            }

            orderRepository_->save(ctx, order);
            ++cancelled;

            auto cancelledEvents = order.popDomainEvents();
            if (publisher) {
                for (auto& cancelledEvent : cancelledEvents) {
                    publisher->publish(ctx, std::move(cancelledEvent));
                }
            }
        }

        std::cout << "[UserDeletedEventHandler] Cancelled " << cancelled << " of " << total
                  << " orders for user " << event.userId() << std::endl;
    }

private:
    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
};

} // namespace monolith::orders::application::handlers
