#pragma once

#include <stdexcept>
#include <string>

/**
 * @file TransactionExceptions.hpp
 * @brief Ошибки транзакционного слоя
 */

namespace monolith::transaction {

/**
 * @brief Базовая ошибка транзакции
 */
class TransactionException : public std::runtime_error {
public:
    explicit TransactionException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Попытка открыть транзакцию в контексте, который уже несёт транзакцию
 *
 * Хранилище не поддерживает вложенные транзакции. Ошибка
 * восстановимая: исходный контекст не изменяется.
 */
class NestedTransactionException : public TransactionException {
public:
    NestedTransactionException()
        : TransactionException(
              "nested transaction detected: storage does not support nested transactions; "
              "use the existing transaction from context instead") {}
};

/**
 * @brief Транзакция прервана из-за конфликта (временная ошибка)
 *
 * Хранилище повторяет транзакцию, получив это исключение.
 */
class TransactionAbortedException : public TransactionException {
public:
    explicit TransactionAbortedException(const std::string& reason)
        : TransactionException("transaction aborted: " + reason) {}
};

} // namespace monolith::transaction
