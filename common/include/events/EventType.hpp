#pragma once

#include <functional>
#include <string>

namespace monolith::events {

/**
 * @brief Тип доменного события в формате "module.PastTenseVerb"
 *
 * Примеры: "users.UserDeleted", "orders.OrderSubmitted".
 * Формат проверяется в конструкторе, невалидный тип это ошибка в коде.
 */
class EventType {
public:
    /**
     * @throws InvalidEventTypeException если формат не соответствует
     *         ^[a-z]+\.[A-Z][a-zA-Z]+$
     */
    explicit EventType(std::string value);

    /**
     * @brief Проверить формат без создания объекта
     */
    static bool isValid(const std::string& value);

    const std::string& str() const { return value_; }

    /// Модуль-владелец (часть до точки)
    std::string module() const;

    /// Имя события (часть после точки)
    std::string name() const;

    bool operator==(const EventType& other) const { return value_ == other.value_; }
    bool operator!=(const EventType& other) const { return value_ != other.value_; }
    bool operator<(const EventType& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

} // namespace monolith::events

template <>
struct std::hash<monolith::events::EventType> {
    size_t operator()(const monolith::events::EventType& type) const noexcept {
        return std::hash<std::string>{}(type.str());
    }
};
