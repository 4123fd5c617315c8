#include "users/adapters/secondary/DatabaseUserRepository.hpp"
#include "transaction/ContextualAccess.hpp"
#include <algorithm>
#include <stdexcept>

namespace monolith::users::adapters::secondary {

using monolith::domain::Timestamp;

DatabaseUserRepository::DatabaseUserRepository(std::shared_ptr<storage::IDatabaseClient> client)
    : client_(std::move(client))
{
    if (!client_) {
        throw std::invalid_argument("DatabaseUserRepository requires a database client");
    }
}

void DatabaseUserRepository::save(const Context& ctx, const domain::User& user) {
    transaction::writeInContext(ctx, *client_,
        {storage::Mutation::insertOrUpdate(TABLE, user.id().value(), toRow(user))});
}

std::optional<domain::User> DatabaseUserRepository::findById(const Context& ctx, const domain::UserId& id) {
    auto row = transaction::readInContext(ctx, *client_, [&](storage::IReadCapability& reader) {
        return reader.readRow(TABLE, id.value());
    });
    if (!row) {
        return std::nullopt;
    }
    return fromRow(*row);
}

std::optional<domain::User> DatabaseUserRepository::findByEmail(const Context& ctx, const domain::Email& email) {
    auto rows = transaction::readInContext(ctx, *client_, [&](storage::IReadCapability& reader) {
        return reader.query(TABLE, "email", email.value());
    });
    if (rows.empty()) {
        return std::nullopt;
    }
    return fromRow(rows.front());
}

bool DatabaseUserRepository::existsByEmail(const Context& ctx, const domain::Email& email) {
    return findByEmail(ctx, email).has_value();
}

std::pair<std::vector<domain::User>, int> DatabaseUserRepository::findAll(const Context& ctx, int offset, int limit) {
    auto rows = transaction::readInContext(ctx, *client_, [&](storage::IReadCapability& reader) {
        return reader.readAll(TABLE);
    });

    std::vector<domain::User> users;
    users.reserve(rows.size());
    for (const auto& row : rows) {
        users.push_back(fromRow(row));
    }
    std::stable_sort(users.begin(), users.end(), [](const domain::User& a, const domain::User& b) {
        return a.createdAt() < b.createdAt();
    });

    int total = static_cast<int>(users.size());
    auto begin = std::min(static_cast<size_t>(std::max(offset, 0)), users.size());
    auto end = std::min(begin + static_cast<size_t>(std::max(limit, 0)), users.size());

    return {std::vector<domain::User>(users.begin() + begin, users.begin() + end), total};
}

storage::Row DatabaseUserRepository::toRow(const domain::User& user) {
    return storage::Row{
        {"id", user.id().value()},
        {"email", user.email().value()},
        {"first_name", user.name().firstName()},
        {"last_name", user.name().lastName()},
        {"status", domain::toString(user.status())},
        {"created_at_us", user.createdAt().toUnixMicros()},
        {"updated_at_us", user.updatedAt().toUnixMicros()}
    };
}

domain::User DatabaseUserRepository::fromRow(const storage::Row& row) {
    return domain::User::reconstitute(
        domain::UserId::parse(row.at("id").get<std::string>()),
        domain::Email::create(row.at("email").get<std::string>()),
        domain::Name::create(row.at("first_name").get<std::string>(), row.at("last_name").get<std::string>()),
        domain::userStatusFromString(row.at("status").get<std::string>()),
        Timestamp::fromUnixMicros(row.at("created_at_us").get<int64_t>()),
        Timestamp::fromUnixMicros(row.at("updated_at_us").get<int64_t>()));
}

} // namespace monolith::users::adapters::secondary
