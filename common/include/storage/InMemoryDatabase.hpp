#pragma once

#include "storage/IDatabaseClient.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace monolith::storage {

/**
 * @brief In-memory хранилище с оптимистичными транзакциями
 *
 * Состояние хранится как неизменяемый снимок (copy-on-write).
 * Каждый коммит публикует новый снимок.
 *
 * Read-write транзакция читает из снимка на момент начала, поверх
 * которого накладываются её собственные записи. Прочитанные строки
 * и таблицы запоминаются с версиями; при коммите версии сверяются
 * с текущим состоянием, и при конфликте транзакция прерывается
 * (TransactionAbortedException) и повторяется.
 *
 * Read-only транзакция читает зафиксированный снимок.
 */
class InMemoryDatabase : public IDatabaseClient {
public:
    static constexpr int DEFAULT_MAX_ATTEMPTS = 5;

    struct VersionedRow {
        Row row;
        uint64_t version = 0;
    };

    struct Table {
        std::map<std::string, VersionedRow> rows;
        uint64_t version = 0;   ///< Номер последнего коммита, изменившего таблицу
    };

    using Snapshot = std::map<std::string, Table>;

    explicit InMemoryDatabase(int maxAttempts = DEFAULT_MAX_ATTEMPTS);

    void runReadWrite(const Context& ctx, const ReadWriteWork& work) override;
    std::shared_ptr<IReadOnlyTransaction> beginReadOnly() override;
    void apply(const std::vector<Mutation>& mutations) override;

    /// Количество открытых read-only транзакций
    int openReadOnlyCount() const;

    /// Количество успешных коммитов (включая apply)
    uint64_t commitCount() const;

    int getMaxAttempts() const { return maxAttempts_; }

private:
    class ReadWriteTransaction;
    class ReadOnlyTransaction;

    std::shared_ptr<const Snapshot> snapshot() const;
    void commit(ReadWriteTransaction& tx);
    void applyLocked(const std::vector<Mutation>& mutations);

    int maxAttempts_;

    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> state_;
    uint64_t commitSeq_ = 0;
    std::shared_ptr<std::atomic<int>> openReadOnly_;
};

} // namespace monolith::storage
