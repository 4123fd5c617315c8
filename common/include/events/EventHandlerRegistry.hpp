#pragma once

#include "events/IEventSubscriber.hpp"
#include "events/IHandlerRegistry.hpp"
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace monolith::events {

/**
 * @brief Реестр транзакционных обработчиков событий
 *
 * Заполняется при старте (subscribe), читается при каждом flush()
 * (handlersFor). Обработчики одного типа хранятся в порядке подписки.
 * Удаление не поддерживается.
 *
 * Экземпляр создаётся явно и передаётся каждой TransactionalEventBus,
 * глобального реестра нет.
 */
class EventHandlerRegistry : public IEventSubscriber, public IHandlerRegistry {
public:
    EventHandlerRegistry() = default;

    void subscribe(const EventType& eventType, EventHandlerPtr handler) override {
        if (!handler) {
            throw std::invalid_argument("cannot subscribe null handler to " + eventType.str());
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        handlers_[eventType].push_back(std::move(handler));
    }

    std::vector<EventHandlerPtr> handlersFor(const EventType& eventType) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = handlers_.find(eventType);
        if (it == handlers_.end()) {
            return {};
        }
        return it->second;
    }

    size_t handlerCount(const EventType& eventType) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<EventType, std::vector<EventHandlerPtr>> handlers_;
};

} // namespace monolith::events
