#pragma once

#include <string>
#include <stdexcept>

namespace monolith::orders::domain {

/**
 * @brief Статус заказа
 *
 * DRAFT → PENDING → CONFIRMED → COMPLETED, отмена возможна
 * из любого статуса, кроме COMPLETED и CANCELLED.
 */
enum class OrderStatus {
    DRAFT,      ///< Черновик, состав можно менять
    PENDING,    ///< Отправлен, ожидает подтверждения
    CONFIRMED,  ///< Подтверждён
    COMPLETED,  ///< Выполнен
    CANCELLED   ///< Отменён
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::DRAFT:     return "draft";
        case OrderStatus::PENDING:   return "pending";
        case OrderStatus::CONFIRMED: return "confirmed";
        case OrderStatus::COMPLETED: return "completed";
        case OrderStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderStatus orderStatusFromString(const std::string& str) {
    if (str == "draft")     return OrderStatus::DRAFT;
    if (str == "pending")   return OrderStatus::PENDING;
    if (str == "confirmed") return OrderStatus::CONFIRMED;
    if (str == "completed") return OrderStatus::COMPLETED;
    if (str == "cancelled") return OrderStatus::CANCELLED;
    throw std::invalid_argument("Unknown OrderStatus: " + str);
}

/**
 * @brief Является ли статус финальным
 */
inline bool isFinalStatus(OrderStatus status) {
    return status == OrderStatus::COMPLETED || status == OrderStatus::CANCELLED;
}

/**
 * @brief Отменяется ли заказ автоматически при удалении пользователя
 */
inline bool isOpenStatus(OrderStatus status) {
    return status == OrderStatus::DRAFT || status == OrderStatus::PENDING;
}

} // namespace monolith::orders::domain
