#pragma once

#include "domain/DomainException.hpp"

/**
 * @file OrderErrors.hpp
 * @brief Коды ошибок модуля orders
 */

namespace monolith::orders::domain::errors {

inline constexpr const char* ORDER_NOT_FOUND = "ORDER_NOT_FOUND";
inline constexpr const char* ORDER_NOT_DRAFT = "ORDER_NOT_DRAFT";
inline constexpr const char* ORDER_NOT_PENDING = "ORDER_NOT_PENDING";
inline constexpr const char* ORDER_NOT_CONFIRMED = "ORDER_NOT_CONFIRMED";
inline constexpr const char* ORDER_EMPTY = "ORDER_EMPTY";
inline constexpr const char* ORDER_ALREADY_CANCELLED = "ORDER_ALREADY_CANCELLED";
inline constexpr const char* ORDER_COMPLETED = "ORDER_COMPLETED";
inline constexpr const char* ITEM_NOT_FOUND = "ITEM_NOT_FOUND";
inline constexpr const char* INVALID_QUANTITY = "INVALID_QUANTITY";
inline constexpr const char* INVALID_PRODUCT = "INVALID_PRODUCT";
inline constexpr const char* INVALID_ORDER_ID = "INVALID_ORDER_ID";
inline constexpr const char* INVALID_USER_REF = "INVALID_USER_REF";

} // namespace monolith::orders::domain::errors
