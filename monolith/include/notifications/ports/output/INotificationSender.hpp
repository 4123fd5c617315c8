#pragma once

#include <string>

namespace monolith::notifications::ports::output {

/**
 * @brief Уведомление пользователю
 */
struct Notification {
    std::string recipientId;    ///< Идентификатор пользователя
    std::string subject;
    std::string body;
};

/**
 * @brief Порт отправки уведомлений (email, push, ...)
 */
class INotificationSender {
public:
    virtual ~INotificationSender() = default;

    /**
     * @throws std::runtime_error при ошибке доставки
     */
    virtual void send(const Notification& notification) = 0;
};

} // namespace monolith::notifications::ports::output
