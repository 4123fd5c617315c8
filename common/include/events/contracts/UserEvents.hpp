#pragma once

#include "events/DomainEvent.hpp"
#include <string>

/**
 * @file UserEvents.hpp
 * @brief Публичный контракт событий модуля users
 *
 * Другие модули зависят только от этого файла, а не от домена users.
 */

namespace monolith::events::contracts {

inline const EventType USER_CREATED{"users.UserCreated"};
inline const EventType USER_UPDATED{"users.UserUpdated"};
inline const EventType USER_DELETED{"users.UserDeleted"};

/**
 * @brief Пользователь удалён (мягкое удаление)
 */
class UserDeletedEvent : public DomainEvent {
public:
    explicit UserDeletedEvent(std::string userId)
        : DomainEvent(USER_DELETED, userId)
        , userId_(std::move(userId))
    {}

    const std::string& userId() const { return userId_; }

    nlohmann::json toJson() const override {
        auto j = DomainEvent::toJson();
        j["user_id"] = userId_;
        return j;
    }

private:
    std::string userId_;
};

} // namespace monolith::events::contracts
