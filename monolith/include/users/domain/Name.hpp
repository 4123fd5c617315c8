#pragma once

#include "users/domain/UserErrors.hpp"
#include <string>

namespace monolith::users::domain {

/**
 * @brief Имя и фамилия пользователя (value object)
 *
 * Каждая часть после обрезки пробелов: от 2 до 50 символов.
 */
class Name {
public:
    static constexpr size_t MIN_LENGTH = 2;
    static constexpr size_t MAX_LENGTH = 50;

    /**
     * @throws DomainException FIRST_NAME_REQUIRED, FIRST_NAME_LENGTH,
     *         LAST_NAME_REQUIRED, LAST_NAME_LENGTH
     */
    static Name create(const std::string& firstName, const std::string& lastName) {
        std::string first = trim(firstName);
        std::string last = trim(lastName);

        if (first.empty()) {
            throw monolith::domain::DomainException(errors::FIRST_NAME_REQUIRED, "first name is required");
        }
        if (first.size() < MIN_LENGTH || first.size() > MAX_LENGTH) {
            throw monolith::domain::DomainException(errors::FIRST_NAME_LENGTH, "first name must be 2-50 characters");
        }
        if (last.empty()) {
            throw monolith::domain::DomainException(errors::LAST_NAME_REQUIRED, "last name is required");
        }
        if (last.size() < MIN_LENGTH || last.size() > MAX_LENGTH) {
            throw monolith::domain::DomainException(errors::LAST_NAME_LENGTH, "last name must be 2-50 characters");
        }
        return Name(std::move(first), std::move(last));
    }

    const std::string& firstName() const { return firstName_; }
    const std::string& lastName() const { return lastName_; }
    std::string fullName() const { return firstName_ + " " + lastName_; }

    bool operator==(const Name& other) const {
        return firstName_ == other.firstName_ && lastName_ == other.lastName_;
    }

private:
    Name(std::string firstName, std::string lastName)
        : firstName_(std::move(firstName)), lastName_(std::move(lastName)) {}

    static std::string trim(const std::string& value) {
        const char* whitespace = " \t\n\r\f\v";
        auto begin = value.find_first_not_of(whitespace);
        if (begin == std::string::npos) {
            return "";
        }
        auto end = value.find_last_not_of(whitespace);
        return value.substr(begin, end - begin + 1);
    }

    std::string firstName_;
    std::string lastName_;
};

} // namespace monolith::users::domain
