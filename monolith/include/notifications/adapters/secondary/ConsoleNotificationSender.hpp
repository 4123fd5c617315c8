#pragma once

#include "notifications/ports/output/INotificationSender.hpp"
#include <iostream>
#include <mutex>

namespace monolith::notifications::adapters::secondary {

/**
 * @brief Отправка уведомлений в stdout
 */
class ConsoleNotificationSender : public ports::output::INotificationSender {
public:
    ConsoleNotificationSender() {
        std::cout << "[ConsoleNotificationSender] Created" << std::endl;
    }

    void send(const ports::output::Notification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[ConsoleNotificationSender] To " << notification.recipientId
                  << ": " << notification.subject << " | " << notification.body << std::endl;
        ++sentCount_;
    }

    size_t sentCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sentCount_;
    }

private:
    mutable std::mutex mutex_;
    size_t sentCount_ = 0;
};

} // namespace monolith::notifications::adapters::secondary
