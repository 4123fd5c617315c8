#pragma once

#include "Context.hpp"
#include "orders/domain/Order.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace monolith::orders::ports::output {

/**
 * @brief Порт хранилища заказов
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    virtual void save(const Context& ctx, const domain::Order& order) = 0;

    virtual std::optional<domain::Order> findById(const Context& ctx, const domain::OrderId& id) = 0;

    /**
     * @brief Заказы пользователя, упорядоченные по дате создания
     * @return Заказы страницы и общее количество заказов пользователя
     */
    virtual std::pair<std::vector<domain::Order>, int> findByUserRef(
        const Context& ctx, const domain::UserRef& userRef, int offset, int limit) = 0;

    virtual void remove(const Context& ctx, const domain::OrderId& id) = 0;
};

} // namespace monolith::orders::ports::output
