#pragma once

#include "events/DomainEvent.hpp"
#include "events/contracts/UserEvents.hpp"
#include <string>

namespace monolith::users::domain {

/// Публичное событие удаления берётся из контракта
using UserDeletedEvent = events::contracts::UserDeletedEvent;

/**
 * @brief Базовые поля событий профиля пользователя
 */
class UserProfileEvent : public events::DomainEvent {
public:
    const std::string& userId() const { return userId_; }
    const std::string& email() const { return email_; }
    const std::string& firstName() const { return firstName_; }
    const std::string& lastName() const { return lastName_; }

    nlohmann::json toJson() const override {
        auto j = DomainEvent::toJson();
        j["user_id"] = userId_;
        j["email"] = email_;
        j["first_name"] = firstName_;
        j["last_name"] = lastName_;
        return j;
    }

protected:
    UserProfileEvent(const events::EventType& type, std::string userId, std::string email,
                     std::string firstName, std::string lastName)
        : DomainEvent(type, userId)
        , userId_(std::move(userId))
        , email_(std::move(email))
        , firstName_(std::move(firstName))
        , lastName_(std::move(lastName))
    {}

private:
    std::string userId_;
    std::string email_;
    std::string firstName_;
    std::string lastName_;
};

class UserCreatedEvent : public UserProfileEvent {
public:
    UserCreatedEvent(std::string userId, std::string email, std::string firstName, std::string lastName)
        : UserProfileEvent(events::contracts::USER_CREATED, std::move(userId), std::move(email),
                           std::move(firstName), std::move(lastName)) {}
};

class UserUpdatedEvent : public UserProfileEvent {
public:
    UserUpdatedEvent(std::string userId, std::string email, std::string firstName, std::string lastName)
        : UserProfileEvent(events::contracts::USER_UPDATED, std::move(userId), std::move(email),
                           std::move(firstName), std::move(lastName)) {}
};

} // namespace monolith::users::domain
