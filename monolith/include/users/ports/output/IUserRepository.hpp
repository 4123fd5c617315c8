#pragma once

#include "Context.hpp"
#include "users/domain/User.hpp"
#include <optional>
#include <vector>

namespace monolith::users::ports::output {

/**
 * @brief Порт хранилища пользователей
 *
 * Все методы принимают Context: если он несёт транзакцию, операции
 * выполняются в ней, иначе репозиторий открывает собственную.
 */
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    virtual void save(const Context& ctx, const domain::User& user) = 0;

    virtual std::optional<domain::User> findById(const Context& ctx, const domain::UserId& id) = 0;

    virtual std::optional<domain::User> findByEmail(const Context& ctx, const domain::Email& email) = 0;

    virtual bool existsByEmail(const Context& ctx, const domain::Email& email) = 0;

    /**
     * @brief Страница пользователей, упорядоченных по дате создания
     * @return Пользователи страницы и общее количество
     */
    virtual std::pair<std::vector<domain::User>, int> findAll(const Context& ctx, int offset, int limit) = 0;
};

} // namespace monolith::users::ports::output
