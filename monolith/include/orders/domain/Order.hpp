#pragma once

#include "domain/AggregateRoot.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "orders/domain/OrderId.hpp"
#include "orders/domain/enums/OrderStatus.hpp"
#include <string>
#include <vector>

namespace monolith::orders::domain {

using monolith::domain::Money;

/**
 * @brief Позиция заказа
 */
struct OrderItem {
    std::string productId;
    std::string productName;
    int quantity = 0;
    Money unitPrice;

    Money subtotal() const { return unitPrice * quantity; }
};

/**
 * @brief Заказ (корень агрегата)
 */
class Order : public monolith::domain::AggregateRoot {
public:
    /**
     * @brief Новый черновик заказа
     *
     * Записывает orders.OrderCreated.
     */
    static Order create(UserRef userRef);

    static Order reconstitute(OrderId id, UserRef userRef, std::vector<OrderItem> items, OrderStatus status,
                              Money total, monolith::domain::Timestamp createdAt,
                              monolith::domain::Timestamp updatedAt);

    const OrderId& id() const { return id_; }
    const UserRef& userRef() const { return userRef_; }
    const std::vector<OrderItem>& items() const { return items_; }
    OrderStatus status() const { return status_; }
    const Money& total() const { return total_; }
    const monolith::domain::Timestamp& createdAt() const { return createdAt_; }
    const monolith::domain::Timestamp& updatedAt() const { return updatedAt_; }

    /**
     * @brief Добавить позицию; повторный productId увеличивает количество
     * @throws DomainException ORDER_NOT_DRAFT, INVALID_QUANTITY, INVALID_PRODUCT, CURRENCY_MISMATCH,
     *         AMOUNT_OVERFLOW
     */
    void addItem(const std::string& productId, const std::string& productName, int quantity, const Money& unitPrice);

    /**
     * @throws DomainException ORDER_NOT_DRAFT, ITEM_NOT_FOUND
     */
    void removeItem(const std::string& productId);

    /**
     * @brief Отправить заказ: DRAFT → PENDING
     *
     * Записывает orders.OrderSubmitted.
     * @throws DomainException ORDER_NOT_DRAFT, ORDER_EMPTY
     */
    void submit();

    /// PENDING → CONFIRMED
    void confirm();

    /// CONFIRMED → COMPLETED
    void complete();

    /**
     * @brief Отменить заказ
     *
     * Записывает orders.OrderCancelled.
     * @throws DomainException ORDER_ALREADY_CANCELLED, ORDER_COMPLETED
     */
    void cancel();

private:
    Order(OrderId id, UserRef userRef, std::vector<OrderItem> items, OrderStatus status, Money total,
          monolith::domain::Timestamp createdAt, monolith::domain::Timestamp updatedAt);

    void ensureDraft() const;
    /// @throws DomainException AMOUNT_OVERFLOW
    static Money totalOf(const std::vector<OrderItem>& items);
    void touch();

    OrderId id_;
    UserRef userRef_;
    std::vector<OrderItem> items_;
    OrderStatus status_;
    Money total_;
    monolith::domain::Timestamp createdAt_;
    monolith::domain::Timestamp updatedAt_;
};

} // namespace monolith::orders::domain
