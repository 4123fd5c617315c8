#pragma once

#include "orders/ports/output/IOrderRepository.hpp"
#include "storage/IDatabaseClient.hpp"
#include <memory>

namespace monolith::orders::adapters::secondary {

/**
 * @brief Репозиторий заказов поверх IDatabaseClient
 *
 * Заказ хранится одним JSON-документом в таблице "orders" вместе
 * с позициями. Поиск по пользователю идёт по полю user_id.
 */
class DatabaseOrderRepository : public ports::output::IOrderRepository {
public:
    static constexpr const char* TABLE = "orders";

    explicit DatabaseOrderRepository(std::shared_ptr<storage::IDatabaseClient> client);

    void save(const Context& ctx, const domain::Order& order) override;
    std::optional<domain::Order> findById(const Context& ctx, const domain::OrderId& id) override;
    std::pair<std::vector<domain::Order>, int> findByUserRef(
        const Context& ctx, const domain::UserRef& userRef, int offset, int limit) override;
    void remove(const Context& ctx, const domain::OrderId& id) override;

    static storage::Row toRow(const domain::Order& order);
    static domain::Order fromRow(const storage::Row& row);

private:
    std::shared_ptr<storage::IDatabaseClient> client_;
};

} // namespace monolith::orders::adapters::secondary
