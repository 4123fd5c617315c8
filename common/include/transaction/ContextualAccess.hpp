#pragma once

#include "transaction/TransactionContext.hpp"
#include "storage/IDatabaseClient.hpp"
#include <vector>

/**
 * @file ContextualAccess.hpp
 * @brief Доступ к хранилищу для репозиториев с учётом транзакции в контексте
 */

namespace monolith::transaction {

/**
 * @brief Выполнить чтение через транзакцию из контекста
 *
 * Без транзакции в контексте открывается одноразовая read-only
 * транзакция, закрываемая по выходу.
 *
 * @param fn Вызывается с storage::IReadCapability&
 */
template <typename Fn>
auto readInContext(const Context& ctx, storage::IDatabaseClient& client, Fn&& fn) {
    if (auto reader = readCapabilityFromContext(ctx)) {
        return fn(*reader);
    }
    auto tx = client.beginReadOnly();
    storage::ReadOnlyTransactionGuard guard(tx);
    return fn(*tx);
}

/**
 * @brief Записать мутации через транзакцию из контекста
 *
 * В read-write транзакции мутации буферизуются до коммита, без
 * транзакции применяются сразу и атомарно.
 *
 * @throws TransactionException если контекст несёт read-only транзакцию
 */
inline void writeInContext(const Context& ctx, storage::IDatabaseClient& client,
                           const std::vector<storage::Mutation>& mutations) {
    if (auto tx = readWriteTxFromContext(ctx)) {
        tx->bufferWrite(mutations);
        return;
    }
    if (readOnlyTxFromContext(ctx)) {
        throw TransactionException("cannot write inside a read-only transaction");
    }
    client.apply(mutations);
}

} // namespace monolith::transaction
