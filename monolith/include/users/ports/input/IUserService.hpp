#pragma once

#include "Context.hpp"
#include "users/domain/User.hpp"
#include <string>
#include <vector>

namespace monolith::users::ports::input {

/**
 * @brief Страница списка пользователей
 */
struct UserPage {
    std::vector<domain::User> users;
    int totalCount = 0;
    int offset = 0;
    int limit = 0;
};

/**
 * @brief Входной порт модуля users
 *
 * Команды выполняются в read-write транзакции вместе с обработчиками
 * событий, запросы в read-only транзакции.
 */
class IUserService {
public:
    virtual ~IUserService() = default;

    /**
     * @brief Зарегистрировать пользователя
     * @return Идентификатор нового пользователя
     * @throws DomainException EMAIL_EXISTS, EMAIL_INVALID, ...
     */
    virtual std::string createUser(const Context& ctx, const std::string& email,
                                   const std::string& firstName, const std::string& lastName) = 0;

    virtual void updateUser(const Context& ctx, const std::string& userId,
                            const std::string& firstName, const std::string& lastName) = 0;

    /**
     * @brief Удалить пользователя
     *
     * Обработчики users.UserDeleted выполняются в той же транзакции.
     */
    virtual void deleteUser(const Context& ctx, const std::string& userId) = 0;

    /**
     * @throws DomainException USER_NOT_FOUND
     */
    virtual domain::User getUser(const Context& ctx, const std::string& userId) = 0;

    virtual UserPage listUsers(const Context& ctx, int offset, int limit) = 0;
};

} // namespace monolith::users::ports::input
