#pragma once

#include "storage/Mutation.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace monolith::storage {

/**
 * @brief Чтение из хранилища: общая часть read-write и read-only транзакций
 *
 * Репозитории читают через этот интерфейс и не знают, какая
 * транзакция им досталась.
 */
class IReadCapability {
public:
    virtual ~IReadCapability() = default;

    /**
     * @brief Прочитать строку по ключу
     * @return std::nullopt если строки нет
     */
    virtual std::optional<Row> readRow(const std::string& table, const std::string& key) = 0;

    /**
     * @brief Строки, у которых поле field равно value, в порядке ключей
     */
    virtual std::vector<Row> query(const std::string& table, const std::string& field, const Row& value) = 0;

    /// Все строки таблицы в порядке ключей
    virtual std::vector<Row> readAll(const std::string& table) = 0;
};

/**
 * @brief Read-write транзакция
 *
 * Записи буферизуются до коммита. Чтения видят собственные
 * буферизованные записи (read-your-writes).
 */
class IReadWriteTransaction : public IReadCapability {
public:
    virtual void bufferWrite(const std::vector<Mutation>& mutations) = 0;
};

/**
 * @brief Read-only транзакция над согласованным снимком
 */
class IReadOnlyTransaction : public IReadCapability {
public:
    /// Освободить снимок. Повторный вызов безопасен.
    virtual void close() = 0;
};

/**
 * @brief RAII: закрывает read-only транзакцию при выходе из области видимости
 */
class ReadOnlyTransactionGuard {
public:
    explicit ReadOnlyTransactionGuard(std::shared_ptr<IReadOnlyTransaction> tx)
        : tx_(std::move(tx)) {}

    ~ReadOnlyTransactionGuard() {
        if (tx_) {
            tx_->close();
        }
    }

    ReadOnlyTransactionGuard(const ReadOnlyTransactionGuard&) = delete;
    ReadOnlyTransactionGuard& operator=(const ReadOnlyTransactionGuard&) = delete;

private:
    std::shared_ptr<IReadOnlyTransaction> tx_;
};

} // namespace monolith::storage
