#pragma once

/**
 * @file MoneyErrors.hpp
 * @brief Коды ошибок денежных операций
 */

namespace monolith::domain::errors {

inline constexpr const char* INVALID_CURRENCY = "INVALID_CURRENCY";
inline constexpr const char* CURRENCY_MISMATCH = "CURRENCY_MISMATCH";
inline constexpr const char* AMOUNT_OVERFLOW = "AMOUNT_OVERFLOW";

} // namespace monolith::domain::errors
