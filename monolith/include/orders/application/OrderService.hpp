#pragma once

#include "orders/ports/input/IOrderService.hpp"
#include "orders/ports/output/IOrderRepository.hpp"
#include "orders/domain/OrderErrors.hpp"
#include "transaction/ITransactionScope.hpp"
#include "transaction/ReadOnlyTransactionScope.hpp"
#include "events/IHandlerRegistry.hpp"
#include "events/IEventPublisher.hpp"
#include "events/TransactionalEventBus.hpp"
#include "settings/AppSettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <vector>

namespace monolith::orders::application {

/**
 * @brief Сервис заказов
 *
 * Команды выполняются так же, как в UserService: транзакция,
 * новый TransactionalEventBus на попытку, publish + flush.
 * События orders.OrderSubmitted дополнительно уходят во внешнюю
 * (post-commit) шину, но только после успешного коммита.
 */
class OrderService : public ports::input::IOrderService {
public:
    static constexpr int DEFAULT_PAGE_SIZE = 20;
    static constexpr int MAX_PAGE_SIZE = 100;

    OrderService(
        std::shared_ptr<ports::output::IOrderRepository> orderRepository,
        std::shared_ptr<transaction::ITransactionScope> transactionScope,
        std::shared_ptr<transaction::ReadOnlyTransactionScope> readScope,
        std::shared_ptr<events::IHandlerRegistry> handlerRegistry,
        std::shared_ptr<events::IEventPublisher> postCommitPublisher,
        std::shared_ptr<settings::AppSettings> settings
    ) : orderRepository_(std::move(orderRepository))
      , transactionScope_(std::move(transactionScope))
      , readScope_(std::move(readScope))
      , handlerRegistry_(std::move(handlerRegistry))
      , postCommitPublisher_(std::move(postCommitPublisher))
      , settings_(std::move(settings))
    {
        std::cout << "[OrderService] Created" << std::endl;
    }

    std::string createOrder(const Context& ctx, const std::string& userId) override {
        auto userRef = domain::UserRef::parse(userId);

        auto orderId = transaction::executeWithResult<std::string>(*transactionScope_, ctx,
            [&](const Context& txCtx) {
                events::TransactionalEventBus eventBus(handlerRegistry_, settings_->getMaxEventDepth());

                auto order = domain::Order::create(userRef);
                orderRepository_->save(txCtx, order);

                eventBus.publishAll(txCtx, order.popDomainEvents());
                eventBus.flush(txCtx);
                return order.id().value();
            });

        std::cout << "[OrderService] Created order " << orderId << " for user " << userId << std::endl;
        return orderId;
    }

    void addItem(const Context& ctx, const std::string& orderId, const std::string& productId,
                 const std::string& productName, int quantity, const domain::Money& unitPrice) override {
        auto id = domain::OrderId::parse(orderId);

        transactionScope_->execute(ctx, [&](const Context& txCtx) {
            auto order = loadOrder(txCtx, id);
            order.addItem(productId, productName, quantity, unitPrice);
            orderRepository_->save(txCtx, order);
        });
    }

    void removeItem(const Context& ctx, const std::string& orderId, const std::string& productId) override {
        auto id = domain::OrderId::parse(orderId);

        transactionScope_->execute(ctx, [&](const Context& txCtx) {
            auto order = loadOrder(txCtx, id);
            order.removeItem(productId);
            orderRepository_->save(txCtx, order);
        });
    }

    void submitOrder(const Context& ctx, const std::string& orderId) override {
        auto id = domain::OrderId::parse(orderId);
        std::vector<events::DomainEventPtr> committed;

        transactionScope_->execute(ctx, [&](const Context& txCtx) {
            events::TransactionalEventBus eventBus(handlerRegistry_, settings_->getMaxEventDepth());

            auto order = loadOrder(txCtx, id);
            order.submit();
            orderRepository_->save(txCtx, order);

            // Повторная попытка перезаписывает список событий предыдущей
            committed = order.popDomainEvents();
            eventBus.publishAll(txCtx, committed);
            eventBus.flush(txCtx);
        });

        std::cout << "[OrderService] Submitted order " << orderId << std::endl;

        for (const auto& event : committed) {
            postCommitPublisher_->publish(ctx, event);
        }
    }

    void cancelOrder(const Context& ctx, const std::string& orderId) override {
        auto id = domain::OrderId::parse(orderId);

        transactionScope_->execute(ctx, [&](const Context& txCtx) {
            events::TransactionalEventBus eventBus(handlerRegistry_, settings_->getMaxEventDepth());

            auto order = loadOrder(txCtx, id);
            order.cancel();
            orderRepository_->save(txCtx, order);

            eventBus.publishAll(txCtx, order.popDomainEvents());
            eventBus.flush(txCtx);
        });

        std::cout << "[OrderService] Cancelled order " << orderId << std::endl;
    }

    domain::Order getOrder(const Context& ctx, const std::string& orderId) override {
        auto id = domain::OrderId::parse(orderId);

        return transaction::executeWithResult<domain::Order>(*readScope_, ctx,
            [&](const Context& txCtx) { return loadOrder(txCtx, id); });
    }

    ports::input::OrderPage listUserOrders(const Context& ctx, const std::string& userId,
                                           int offset, int limit) override {
        auto userRef = domain::UserRef::parse(userId);

        ports::input::OrderPage page;
        page.offset = std::max(offset, 0);
        page.limit = limit <= 0 ? DEFAULT_PAGE_SIZE : std::min(limit, MAX_PAGE_SIZE);

        readScope_->execute(ctx, [&](const Context& txCtx) {
            auto [orders, total] = orderRepository_->findByUserRef(txCtx, userRef, page.offset, page.limit);
            page.orders = std::move(orders);
            page.totalCount = total;
        });
        return page;
    }

private:
    domain::Order loadOrder(const Context& ctx, const domain::OrderId& id) {
        auto order = orderRepository_->findById(ctx, id);
        if (!order) {
            throw monolith::domain::DomainException(domain::errors::ORDER_NOT_FOUND,
                "order not found: " + id.value());
        }
        return std::move(*order);
    }

    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<transaction::ITransactionScope> transactionScope_;
    std::shared_ptr<transaction::ReadOnlyTransactionScope> readScope_;
    std::shared_ptr<events::IHandlerRegistry> handlerRegistry_;
    std::shared_ptr<events::IEventPublisher> postCommitPublisher_;
    std::shared_ptr<settings::AppSettings> settings_;
};

} // namespace monolith::orders::application
