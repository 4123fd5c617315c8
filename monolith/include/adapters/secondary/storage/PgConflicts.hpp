#pragma once

#include "transaction/TransactionExceptions.hpp"
#include <pqxx/except>
#include <utility>

namespace monolith::adapters::secondary {

/**
 * @brief Выполнить операцию PostgreSQL, переведя конфликты в TransactionAbortedException
 *
 * На уровне SERIALIZABLE serialization_failure и deadlock_detected
 * возможны на любом запросе, в том числе внутри обработчика события.
 * TransactionalEventBus пропускает TransactionAbortedException без
 * обёртки, и runReadWrite повторяет транзакцию.
 */
template <typename Fn>
decltype(auto) translateConflicts(Fn&& fn) {
    try {
        return std::forward<Fn>(fn)();
    } catch (const pqxx::serialization_failure& e) {
        throw transaction::TransactionAbortedException(e.what());
    } catch (const pqxx::deadlock_detected& e) {
        throw transaction::TransactionAbortedException(e.what());
    }
}

} // namespace monolith::adapters::secondary
