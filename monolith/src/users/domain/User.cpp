#include "users/domain/User.hpp"
#include "users/domain/events/UserEvents.hpp"

namespace monolith::users::domain {

using monolith::domain::DomainException;
using monolith::domain::Timestamp;

User::User(UserId id, Email email, Name name, UserStatus status, Timestamp createdAt, Timestamp updatedAt)
    : id_(std::move(id))
    , email_(std::move(email))
    , name_(std::move(name))
    , status_(status)
    , createdAt_(createdAt)
    , updatedAt_(updatedAt)
{}

User User::create(Email email, Name name) {
    auto now = Timestamp::now();
    User user(UserId::generate(), std::move(email), std::move(name), UserStatus::ACTIVE, now, now);
    user.addDomainEvent(std::make_shared<UserCreatedEvent>(
        user.id_.value(), user.email_.value(), user.name_.firstName(), user.name_.lastName()));
    return user;
}

User User::reconstitute(UserId id, Email email, Name name, UserStatus status,
                        Timestamp createdAt, Timestamp updatedAt) {
    return User(std::move(id), std::move(email), std::move(name), status, createdAt, updatedAt);
}

void User::updateProfile(Name name) {
    ensureNotDeleted();
    name_ = std::move(name);
    touch();
    addDomainEvent(std::make_shared<UserUpdatedEvent>(
        id_.value(), email_.value(), name_.firstName(), name_.lastName()));
}

void User::changeEmail(Email email) {
    ensureNotDeleted();
    email_ = std::move(email);
    touch();
}

void User::deactivate() {
    ensureNotDeleted();
    status_ = UserStatus::INACTIVE;
    touch();
}

void User::activate() {
    ensureNotDeleted();
    status_ = UserStatus::ACTIVE;
    touch();
}

void User::remove() {
    ensureNotDeleted();
    status_ = UserStatus::DELETED;
    touch();
    addDomainEvent(std::make_shared<UserDeletedEvent>(id_.value()));
}

void User::ensureNotDeleted() const {
    if (status_ == UserStatus::DELETED) {
        throw DomainException(errors::USER_DELETED, "user has been deleted: " + id_.value());
    }
}

void User::touch() {
    updatedAt_ = Timestamp::now();
}

} // namespace monolith::users::domain
