#pragma once

#include <stdexcept>
#include <string>

/**
 * @file DomainException.hpp
 * @brief Исключение нарушения бизнес-правила
 */

namespace monolith::domain {

/**
 * @brief Нарушение бизнес-правила с машиночитаемым кодом
 *
 * Код стабилен (USER_NOT_FOUND, ORDER_NOT_DRAFT, ...) и уходит наружу
 * через primary-адаптер, сообщение предназначено человеку.
 */
class DomainException : public std::runtime_error {
public:
    DomainException(std::string code, const std::string& message)
        : std::runtime_error(message)
        , code_(std::move(code))
    {}

    const std::string& getCode() const noexcept { return code_; }

private:
    std::string code_;
};

} // namespace monolith::domain
