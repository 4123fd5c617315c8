#pragma once

#include "users/domain/UserErrors.hpp"
#include "domain/Uuid.hpp"
#include <string>

namespace monolith::users::domain {

/**
 * @brief Идентификатор пользователя (UUID)
 */
class UserId {
public:
    static UserId generate() {
        return UserId(monolith::domain::generateUuid());
    }

    /**
     * @throws DomainException INVALID_USER_ID
     */
    static UserId parse(const std::string& value) {
        if (!monolith::domain::isUuid(value)) {
            throw monolith::domain::DomainException(errors::INVALID_USER_ID, "invalid user id: '" + value + "'");
        }
        return UserId(value);
    }

    const std::string& value() const { return value_; }

    bool operator==(const UserId& other) const { return value_ == other.value_; }
    bool operator!=(const UserId& other) const { return value_ != other.value_; }

private:
    explicit UserId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

} // namespace monolith::users::domain
