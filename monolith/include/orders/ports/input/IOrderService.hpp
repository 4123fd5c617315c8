#pragma once

#include "Context.hpp"
#include "orders/domain/Order.hpp"
#include <string>
#include <vector>

namespace monolith::orders::ports::input {

struct OrderPage {
    std::vector<domain::Order> orders;
    int totalCount = 0;
    int offset = 0;
    int limit = 0;
};

/**
 * @brief Входной порт модуля orders
 */
class IOrderService {
public:
    virtual ~IOrderService() = default;

    /**
     * @return Идентификатор нового заказа (статус draft)
     * @throws DomainException INVALID_USER_REF
     */
    virtual std::string createOrder(const Context& ctx, const std::string& userId) = 0;

    /**
     * @throws DomainException ORDER_NOT_FOUND, ORDER_NOT_DRAFT, INVALID_QUANTITY
     */
    virtual void addItem(const Context& ctx, const std::string& orderId, const std::string& productId,
                         const std::string& productName, int quantity, const domain::Money& unitPrice) = 0;

    virtual void removeItem(const Context& ctx, const std::string& orderId, const std::string& productId) = 0;

    /**
     * @brief Отправить заказ
     *
     * После фиксации транзакции orders.OrderSubmitted уходит
     * в post-commit шину.
     * @throws DomainException ORDER_NOT_FOUND, ORDER_NOT_DRAFT, ORDER_EMPTY
     */
    virtual void submitOrder(const Context& ctx, const std::string& orderId) = 0;

    virtual void cancelOrder(const Context& ctx, const std::string& orderId) = 0;

    virtual domain::Order getOrder(const Context& ctx, const std::string& orderId) = 0;

    virtual OrderPage listUserOrders(const Context& ctx, const std::string& userId, int offset, int limit) = 0;
};

} // namespace monolith::orders::ports::input
