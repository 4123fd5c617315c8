#pragma once

#include "Context.hpp"
#include "events/DomainEvent.hpp"
#include <functional>
#include <memory>

namespace monolith::events {

/**
 * @brief Обработчик доменного события
 *
 * Транзакционный обработчик вызывается внутри транзакции команды:
 * ctx несёт ту же транзакцию, исключение приводит к откату всей команды.
 */
class IEventHandler {
public:
    virtual ~IEventHandler() = default;

    virtual void handle(const Context& ctx, const DomainEvent& event) = 0;
};

using EventHandlerPtr = std::shared_ptr<IEventHandler>;

/**
 * @brief Адаптер: функция как обработчик
 */
class EventHandlerFunc : public IEventHandler {
public:
    using Func = std::function<void(const Context&, const DomainEvent&)>;

    explicit EventHandlerFunc(Func func) : func_(std::move(func)) {}

    void handle(const Context& ctx, const DomainEvent& event) override {
        func_(ctx, event);
    }

private:
    Func func_;
};

/**
 * @brief Типизированный обработчик
 *
 * Приводит событие к E через dynamic_cast. Событие другого
 * конкретного типа игнорируется.
 *
 * @tparam E Конкретный класс события (наследник DomainEvent)
 */
template <typename E>
class TypedEventHandler : public IEventHandler {
public:
    void handle(const Context& ctx, const DomainEvent& event) final {
        if (const auto* typed = dynamic_cast<const E*>(&event)) {
            handleEvent(ctx, *typed);
        }
    }

protected:
    virtual void handleEvent(const Context& ctx, const E& event) = 0;
};

/**
 * @brief Типизированный обработчик из функции
 */
template <typename E>
class TypedEventHandlerFunc : public TypedEventHandler<E> {
public:
    using Func = std::function<void(const Context&, const E&)>;

    explicit TypedEventHandlerFunc(Func func) : func_(std::move(func)) {}

protected:
    void handleEvent(const Context& ctx, const E& event) override {
        func_(ctx, event);
    }

private:
    Func func_;
};

} // namespace monolith::events
