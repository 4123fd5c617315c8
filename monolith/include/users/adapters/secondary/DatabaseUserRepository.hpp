#pragma once

#include "users/ports/output/IUserRepository.hpp"
#include "storage/IDatabaseClient.hpp"
#include <memory>

namespace monolith::users::adapters::secondary {

/**
 * @brief Репозиторий пользователей поверх IDatabaseClient
 *
 * Пользователь хранится JSON-документом в таблице "users" по ключу id.
 * Чтения идут через транзакцию из контекста (включая read-your-writes),
 * записи буферизуются в read-write транзакции контекста.
 */
class DatabaseUserRepository : public ports::output::IUserRepository {
public:
    static constexpr const char* TABLE = "users";

    explicit DatabaseUserRepository(std::shared_ptr<storage::IDatabaseClient> client);

    void save(const Context& ctx, const domain::User& user) override;
    std::optional<domain::User> findById(const Context& ctx, const domain::UserId& id) override;
    std::optional<domain::User> findByEmail(const Context& ctx, const domain::Email& email) override;
    bool existsByEmail(const Context& ctx, const domain::Email& email) override;
    std::pair<std::vector<domain::User>, int> findAll(const Context& ctx, int offset, int limit) override;

    static storage::Row toRow(const domain::User& user);
    static domain::User fromRow(const storage::Row& row);

private:
    std::shared_ptr<storage::IDatabaseClient> client_;
};

} // namespace monolith::users::adapters::secondary
