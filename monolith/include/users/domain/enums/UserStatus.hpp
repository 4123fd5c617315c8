#pragma once

#include <string>
#include <stdexcept>

namespace monolith::users::domain {

/**
 * @brief Статус учётной записи пользователя
 */
enum class UserStatus {
    ACTIVE,     ///< Активен
    INACTIVE,   ///< Деактивирован, может быть активирован снова
    DELETED     ///< Удалён (мягкое удаление), изменения запрещены
};

inline std::string toString(UserStatus status) {
    switch (status) {
        case UserStatus::ACTIVE:   return "active";
        case UserStatus::INACTIVE: return "inactive";
        case UserStatus::DELETED:  return "deleted";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline UserStatus userStatusFromString(const std::string& str) {
    if (str == "active")   return UserStatus::ACTIVE;
    if (str == "inactive") return UserStatus::INACTIVE;
    if (str == "deleted")  return UserStatus::DELETED;
    throw std::invalid_argument("Unknown UserStatus: " + str);
}

} // namespace monolith::users::domain
