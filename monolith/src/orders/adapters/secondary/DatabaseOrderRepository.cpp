#include "orders/adapters/secondary/DatabaseOrderRepository.hpp"
#include "transaction/ContextualAccess.hpp"
#include <algorithm>
#include <stdexcept>

namespace monolith::orders::adapters::secondary {

using monolith::domain::Timestamp;

DatabaseOrderRepository::DatabaseOrderRepository(std::shared_ptr<storage::IDatabaseClient> client)
    : client_(std::move(client))
{
    if (!client_) {
        throw std::invalid_argument("DatabaseOrderRepository requires a database client");
    }
}

void DatabaseOrderRepository::save(const Context& ctx, const domain::Order& order) {
    transaction::writeInContext(ctx, *client_,
        {storage::Mutation::insertOrUpdate(TABLE, order.id().value(), toRow(order))});
}

std::optional<domain::Order> DatabaseOrderRepository::findById(const Context& ctx, const domain::OrderId& id) {
    auto row = transaction::readInContext(ctx, *client_, [&](storage::IReadCapability& reader) {
        return reader.readRow(TABLE, id.value());
    });
    if (!row) {
        return std::nullopt;
    }
    return fromRow(*row);
}

std::pair<std::vector<domain::Order>, int> DatabaseOrderRepository::findByUserRef(
    const Context& ctx, const domain::UserRef& userRef, int offset, int limit)
{
    auto rows = transaction::readInContext(ctx, *client_, [&](storage::IReadCapability& reader) {
        return reader.query(TABLE, "user_id", userRef.value());
    });

    std::vector<domain::Order> orders;
    orders.reserve(rows.size());
    for (const auto& row : rows) {
        orders.push_back(fromRow(row));
    }
    std::stable_sort(orders.begin(), orders.end(), [](const domain::Order& a, const domain::Order& b) {
        return a.createdAt() < b.createdAt();
    });

    int total = static_cast<int>(orders.size());
    auto begin = std::min(static_cast<size_t>(std::max(offset, 0)), orders.size());
    auto end = std::min(begin + static_cast<size_t>(std::max(limit, 0)), orders.size());

    return {std::vector<domain::Order>(orders.begin() + begin, orders.begin() + end), total};
}

void DatabaseOrderRepository::remove(const Context& ctx, const domain::OrderId& id) {
    transaction::writeInContext(ctx, *client_, {storage::Mutation::remove(TABLE, id.value())});
}

storage::Row DatabaseOrderRepository::toRow(const domain::Order& order) {
    auto items = nlohmann::json::array();
    for (const auto& item : order.items()) {
        items.push_back({
            {"product_id", item.productId},
            {"product_name", item.productName},
            {"quantity", item.quantity},
            {"unit_price", item.unitPrice.amount()},
            {"currency", item.unitPrice.currency()}
        });
    }

    return storage::Row{
        {"id", order.id().value()},
        {"user_id", order.userRef().value()},
        {"status", domain::toString(order.status())},
        {"items", items},
        {"total_amount", order.total().amount()},
        {"currency", order.total().currency()},
        {"created_at_us", order.createdAt().toUnixMicros()},
        {"updated_at_us", order.updatedAt().toUnixMicros()}
    };
}

domain::Order DatabaseOrderRepository::fromRow(const storage::Row& row) {
    std::vector<domain::OrderItem> items;
    for (const auto& item : row.at("items")) {
        items.push_back(domain::OrderItem{
            item.at("product_id").get<std::string>(),
            item.at("product_name").get<std::string>(),
            item.at("quantity").get<int>(),
            domain::Money(item.at("unit_price").get<int64_t>(), item.at("currency").get<std::string>())
        });
    }

    return domain::Order::reconstitute(
        domain::OrderId::parse(row.at("id").get<std::string>()),
        domain::UserRef::parse(row.at("user_id").get<std::string>()),
        std::move(items),
        domain::orderStatusFromString(row.at("status").get<std::string>()),
        domain::Money(row.at("total_amount").get<int64_t>(), row.at("currency").get<std::string>()),
        Timestamp::fromUnixMicros(row.at("created_at_us").get<int64_t>()),
        Timestamp::fromUnixMicros(row.at("updated_at_us").get<int64_t>()));
}

} // namespace monolith::orders::adapters::secondary
