#pragma once

#include "storage/IDatabaseClient.hpp"
#include "settings/AppSettings.hpp"
#include "settings/DbSettings.hpp"
#include <memory>
#include <string>
#include <vector>

namespace monolith::adapters::secondary {

/**
 * @brief Хранилище на PostgreSQL (libpqxx)
 *
 * Каждая таблица хранит документы агрегатов: (id TEXT PRIMARY KEY, body JSONB).
 * Read-write транзакции выполняются на уровне SERIALIZABLE; конфликт
 * сериализации и deadlock приводят к повтору работы в новой транзакции.
 * Записи выполняются сразу в открытой транзакции, поэтому чтения
 * той же транзакции их видят.
 */
class PostgresDatabase : public storage::IDatabaseClient {
public:
    PostgresDatabase(std::shared_ptr<settings::DbSettings> dbSettings,
                     std::shared_ptr<settings::AppSettings> appSettings);

    void runReadWrite(const Context& ctx, const ReadWriteWork& work) override;
    std::shared_ptr<storage::IReadOnlyTransaction> beginReadOnly() override;
    void apply(const std::vector<storage::Mutation>& mutations) override;

    /// Таблицы документов, создаваемые при старте
    static const std::vector<std::string>& tables();

private:
    void ensureSchema();
    bool shouldRetry(int attempt, const std::string& reason) const;

    std::shared_ptr<settings::DbSettings> dbSettings_;
    int maxAttempts_;
};

} // namespace monolith::adapters::secondary
