#pragma once

#include "Context.hpp"
#include "storage/ITransaction.hpp"
#include "transaction/TransactionExceptions.hpp"
#include <memory>

/**
 * @file TransactionContext.hpp
 * @brief Передача транзакции через Context
 *
 * Контекст несёт не более одной транзакции. Репозитории читают через
 * readCapabilityFromContext() и пишут через readWriteTxFromContext();
 * только если транзакции в контексте нет, они открывают собственную
 * одноразовую операцию.
 */

namespace monolith::transaction {

/**
 * @brief Дочерний контекст с read-write транзакцией
 * @throws NestedTransactionException если ctx уже несёт транзакцию любого вида
 */
Context withReadWriteTx(const Context& ctx, std::shared_ptr<storage::IReadWriteTransaction> tx);

/**
 * @brief Дочерний контекст с read-only транзакцией
 * @throws NestedTransactionException если ctx уже несёт транзакцию любого вида
 */
Context withReadOnlyTx(const Context& ctx, std::shared_ptr<storage::IReadOnlyTransaction> tx);

/// Read-write транзакция из контекста или nullptr
std::shared_ptr<storage::IReadWriteTransaction> readWriteTxFromContext(const Context& ctx);

/// Read-only транзакция из контекста или nullptr
std::shared_ptr<storage::IReadOnlyTransaction> readOnlyTxFromContext(const Context& ctx);

/**
 * @brief Читающая часть любой транзакции в контексте
 *
 * Сначала проверяется read-write транзакция, чтобы чтения видели
 * собственные записи, затем read-only. nullptr если транзакции нет.
 */
std::shared_ptr<storage::IReadCapability> readCapabilityFromContext(const Context& ctx);

/// Несёт ли контекст транзакцию любого вида
bool hasTransaction(const Context& ctx);

} // namespace monolith::transaction
