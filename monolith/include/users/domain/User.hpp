#pragma once

#include "domain/AggregateRoot.hpp"
#include "domain/Timestamp.hpp"
#include "users/domain/UserId.hpp"
#include "users/domain/Email.hpp"
#include "users/domain/Name.hpp"
#include "users/domain/enums/UserStatus.hpp"

namespace monolith::users::domain {

/**
 * @brief Пользователь (корень агрегата)
 *
 * Изменения только через бизнес-методы. Удалённого пользователя
 * изменить нельзя (USER_DELETED).
 */
class User : public monolith::domain::AggregateRoot {
public:
    /**
     * @brief Создать нового активного пользователя
     *
     * Записывает событие users.UserCreated.
     */
    static User create(Email email, Name name);

    /**
     * @brief Восстановить из хранилища (без событий)
     */
    static User reconstitute(UserId id, Email email, Name name, UserStatus status,
                             monolith::domain::Timestamp createdAt,
                             monolith::domain::Timestamp updatedAt);

    const UserId& id() const { return id_; }
    const Email& email() const { return email_; }
    const Name& name() const { return name_; }
    UserStatus status() const { return status_; }
    const monolith::domain::Timestamp& createdAt() const { return createdAt_; }
    const monolith::domain::Timestamp& updatedAt() const { return updatedAt_; }

    bool isActive() const { return status_ == UserStatus::ACTIVE; }
    bool isDeleted() const { return status_ == UserStatus::DELETED; }

    /// Записывает users.UserUpdated
    void updateProfile(Name name);

    void changeEmail(Email email);
    void deactivate();
    void activate();

    /**
     * @brief Мягкое удаление
     *
     * Записывает users.UserDeleted. Повторное удаление запрещено.
     */
    void remove();

private:
    User(UserId id, Email email, Name name, UserStatus status,
         monolith::domain::Timestamp createdAt, monolith::domain::Timestamp updatedAt);

    void ensureNotDeleted() const;
    void touch();

    UserId id_;
    Email email_;
    Name name_;
    UserStatus status_;
    monolith::domain::Timestamp createdAt_;
    monolith::domain::Timestamp updatedAt_;
};

} // namespace monolith::users::domain
