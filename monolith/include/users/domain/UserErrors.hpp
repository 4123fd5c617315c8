#pragma once

#include "domain/DomainException.hpp"

/**
 * @file UserErrors.hpp
 * @brief Коды ошибок модуля users
 */

namespace monolith::users::domain::errors {

inline constexpr const char* USER_NOT_FOUND = "USER_NOT_FOUND";
inline constexpr const char* USER_DELETED = "USER_DELETED";
inline constexpr const char* INVALID_USER_ID = "INVALID_USER_ID";

inline constexpr const char* EMAIL_REQUIRED = "EMAIL_REQUIRED";
inline constexpr const char* EMAIL_INVALID = "EMAIL_INVALID";
inline constexpr const char* EMAIL_EXISTS = "EMAIL_EXISTS";

inline constexpr const char* FIRST_NAME_REQUIRED = "FIRST_NAME_REQUIRED";
inline constexpr const char* FIRST_NAME_LENGTH = "FIRST_NAME_LENGTH";
inline constexpr const char* LAST_NAME_REQUIRED = "LAST_NAME_REQUIRED";
inline constexpr const char* LAST_NAME_LENGTH = "LAST_NAME_LENGTH";

} // namespace monolith::users::domain::errors
