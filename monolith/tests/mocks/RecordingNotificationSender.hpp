#pragma once

#include "notifications/ports/output/INotificationSender.hpp"
#include <stdexcept>
#include <vector>

namespace monolith::tests {

/**
 * @brief INotificationSender, запоминающий отправленные уведомления
 */
class RecordingNotificationSender : public notifications::ports::output::INotificationSender {
public:
    void send(const notifications::ports::output::Notification& notification) override {
        if (failNext_) {
            failNext_ = false;
            throw std::runtime_error("smtp unavailable");
        }
        sent_.push_back(notification);
    }

    void failNextSend() { failNext_ = true; }

    const std::vector<notifications::ports::output::Notification>& sent() const { return sent_; }

private:
    std::vector<notifications::ports::output::Notification> sent_;
    bool failNext_ = false;
};

} // namespace monolith::tests
