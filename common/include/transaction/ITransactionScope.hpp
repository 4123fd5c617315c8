#pragma once

#include "Context.hpp"
#include <functional>
#include <optional>
#include <stdexcept>

namespace monolith::transaction {

/**
 * @brief Граница транзакции для сервисов приложения
 *
 * execute() открывает транзакцию, кладёт её в дочерний контекст и
 * вызывает fn с этим контекстом. Если fn завершился без исключения,
 * транзакция коммитится, иначе откатывается и исключение пробрасывается.
 *
 * fn может быть вызван повторно (read-write транзакции повторяются при
 * конфликтах): всё состояние попытки, включая TransactionalEventBus,
 * создаётся внутри fn, внешних побочных эффектов в fn быть не должно.
 */
class ITransactionScope {
public:
    using Work = std::function<void(const Context&)>;

    virtual ~ITransactionScope() = default;

    virtual void execute(const Context& ctx, const Work& fn) = 0;
};

/**
 * @brief execute() с возвращаемым значением
 *
 * Возвращает значение последней (зафиксированной) попытки.
 */
template <typename T>
T executeWithResult(ITransactionScope& scope, const Context& ctx, const std::function<T(const Context&)>& fn) {
    std::optional<T> result;
    scope.execute(ctx, [&](const Context& txCtx) {
        result = fn(txCtx);
    });
    if (!result) {
        throw std::logic_error("transaction scope completed without running the work function");
    }
    return std::move(*result);
}

} // namespace monolith::transaction
