#pragma once

#include "orders/domain/OrderErrors.hpp"
#include "domain/Uuid.hpp"
#include <string>

namespace monolith::orders::domain {

/**
 * @brief Идентификатор заказа (UUID)
 */
class OrderId {
public:
    static OrderId generate() {
        return OrderId(monolith::domain::generateUuid());
    }

    /**
     * @throws DomainException INVALID_ORDER_ID
     */
    static OrderId parse(const std::string& value) {
        if (!monolith::domain::isUuid(value)) {
            throw monolith::domain::DomainException(errors::INVALID_ORDER_ID, "invalid order id: '" + value + "'");
        }
        return OrderId(value);
    }

    const std::string& value() const { return value_; }

    bool operator==(const OrderId& other) const { return value_ == other.value_; }

private:
    explicit OrderId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

/**
 * @brief Ссылка на пользователя внутри модуля orders
 *
 * Модуль orders не зависит от домена users: хранит только
 * проверенный идентификатор.
 */
class UserRef {
public:
    /**
     * @throws DomainException INVALID_USER_REF
     */
    static UserRef parse(const std::string& value) {
        if (!monolith::domain::isUuid(value)) {
            throw monolith::domain::DomainException(errors::INVALID_USER_REF, "invalid user reference: '" + value + "'");
        }
        return UserRef(value);
    }

    const std::string& value() const { return value_; }

    bool operator==(const UserRef& other) const { return value_ == other.value_; }

private:
    explicit UserRef(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

} // namespace monolith::orders::domain
