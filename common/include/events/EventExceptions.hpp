#pragma once

#include <stdexcept>
#include <string>

/**
 * @file EventExceptions.hpp
 * @brief Ошибки событийной подсистемы
 */

namespace monolith::events {

/**
 * @brief Неверный формат типа события
 *
 * Логическая ошибка: тип события задаётся в коде, а не во входных данных.
 */
class InvalidEventTypeException : public std::invalid_argument {
public:
    explicit InvalidEventTypeException(const std::string& value)
        : std::invalid_argument("invalid event type format: '" + value +
                                "' (expected 'module.PastTenseVerb')") {}
};

/**
 * @brief Превышена глубина обработки событий в одном flush()
 *
 * Сигнализирует о цикле (A публикует B, B публикует A) или слишком
 * длинной цепочке событий.
 */
class EventProcessingDepthExceededException : public std::runtime_error {
public:
    explicit EventProcessingDepthExceededException(int maxDepth)
        : std::runtime_error("event processing depth exceeded: possible infinite loop (max depth " +
                             std::to_string(maxDepth) + ")")
        , maxDepth_(maxDepth) {}

    int getMaxDepth() const noexcept { return maxDepth_; }

private:
    int maxDepth_;
};

/**
 * @brief Ошибка обработчика события
 *
 * Исходное исключение вложено (std::throw_with_nested),
 * достаётся через std::rethrow_if_nested.
 */
class EventHandlerException : public std::runtime_error {
public:
    EventHandlerException(const std::string& eventType, const std::string& cause)
        : std::runtime_error("handler failed for event " + eventType + ": " + cause)
        , eventType_(eventType) {}

    const std::string& getEventType() const noexcept { return eventType_; }

private:
    std::string eventType_;
};

} // namespace monolith::events
