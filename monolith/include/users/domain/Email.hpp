#pragma once

#include "users/domain/UserErrors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <string>

namespace monolith::users::domain {

/**
 * @brief Email пользователя (value object)
 *
 * Нормализуется: пробелы по краям отбрасываются, регистр понижается.
 */
class Email {
public:
    /**
     * @throws DomainException EMAIL_REQUIRED, EMAIL_INVALID
     */
    static Email create(const std::string& raw) {
        std::string value = normalize(raw);
        if (value.empty()) {
            throw monolith::domain::DomainException(errors::EMAIL_REQUIRED, "email is required");
        }

        static const std::regex pattern(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
        if (!std::regex_match(value, pattern)) {
            throw monolith::domain::DomainException(errors::EMAIL_INVALID, "email format is invalid: '" + raw + "'");
        }
        return Email(std::move(value));
    }

    const std::string& value() const { return value_; }

    bool operator==(const Email& other) const { return value_ == other.value_; }

private:
    explicit Email(std::string value) : value_(std::move(value)) {}

    static std::string normalize(const std::string& raw) {
        auto begin = std::find_if_not(raw.begin(), raw.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        std::string value = begin < end ? std::string(begin, end) : std::string();
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string value_;
};

} // namespace monolith::users::domain
