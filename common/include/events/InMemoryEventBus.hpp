#pragma once

#include "events/IEventPublisher.hpp"
#include "events/IEventSubscriber.hpp"
#include <unordered_map>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace monolith::events {

/**
 * @brief Нетранзакционная in-memory шина событий
 *
 * Для внешних побочных эффектов (уведомления), которые выполняются
 * после коммита и не должны участвовать в транзакции.
 *
 * Доставка синхронная. Ошибка одного обработчика логируется
 * и не мешает остальным, publish() из-за обработчиков не бросает.
 */
class InMemoryEventBus : public IEventPublisher, public IEventSubscriber {
public:
    InMemoryEventBus() = default;

    /**
     * @brief Опубликовать событие
     *
     * Синхронно вызывает все обработчики данного типа.
     */
    void publish(const Context& ctx, DomainEventPtr event) override {
        if (!event) {
            throw std::invalid_argument("cannot publish null event");
        }

        std::vector<EventHandlerPtr> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(event->eventType());
            if (it == handlers_.end()) {
                return;
            }
            handlers = it->second;
        }

        for (const auto& handler : handlers) {
            try {
                handler->handle(ctx, *event);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler failed for " << event->eventType().str()
                          << " (" << event->eventId() << "): " << e.what() << std::endl;
            }
        }
    }

    /**
     * @brief Подписаться на тип события
     */
    void subscribe(const EventType& eventType, EventHandlerPtr handler) override {
        if (!handler) {
            throw std::invalid_argument("cannot subscribe null handler to " + eventType.str());
        }
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_[eventType].push_back(std::move(handler));
    }

    bool hasSubscribers(const EventType& eventType) const {
        return subscriberCount(eventType) > 0;
    }

    size_t subscriberCount(const EventType& eventType) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    mutable std::mutex handlersMutex_;
    std::unordered_map<EventType, std::vector<EventHandlerPtr>> handlers_;
};

} // namespace monolith::events
