#include "adapters/secondary/storage/PostgresDatabase.hpp"
#include "adapters/secondary/storage/PgConflicts.hpp"
#include "transaction/TransactionExceptions.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <stdexcept>

namespace monolith::adapters::secondary {

namespace {

using storage::Mutation;
using storage::Row;

using SerializableWork = pqxx::transaction<pqxx::isolation_level::serializable>;

std::optional<Row> selectRow(pqxx::transaction_base& t, const std::string& table, const std::string& key) {
    auto r = t.exec_params("SELECT body FROM " + t.quote_name(table) + " WHERE id=$1", key);
    if (r.empty()) {
        return std::nullopt;
    }
    return Row::parse(r[0][0].as<std::string>());
}

std::vector<Row> toRows(const pqxx::result& r) {
    std::vector<Row> rows;
    rows.reserve(r.size());
    for (const auto& row : r) {
        rows.push_back(Row::parse(row[0].as<std::string>()));
    }
    return rows;
}

std::vector<Row> selectWhere(pqxx::transaction_base& t, const std::string& table,
                             const std::string& field, const Row& value) {
    return toRows(t.exec_params(
        "SELECT body FROM " + t.quote_name(table) + " WHERE body->$1 = $2::jsonb ORDER BY id",
        field, value.dump()));
}

std::vector<Row> selectAll(pqxx::transaction_base& t, const std::string& table) {
    return toRows(t.exec("SELECT body FROM " + t.quote_name(table) + " ORDER BY id"));
}

void execMutations(pqxx::transaction_base& t, const std::vector<Mutation>& mutations) {
    for (const auto& m : mutations) {
        if (m.table.empty() || m.key.empty()) {
            throw std::invalid_argument("mutation requires table and key");
        }
        if (m.kind == Mutation::Kind::DELETE) {
            t.exec_params("DELETE FROM " + t.quote_name(m.table) + " WHERE id=$1", m.key);
        } else {
            t.exec_params(
                "INSERT INTO " + t.quote_name(m.table) + " (id, body) VALUES ($1, $2::jsonb) "
                "ON CONFLICT (id) DO UPDATE SET body = EXCLUDED.body",
                m.key, m.row.dump());
        }
    }
}

// ============================================================================
// Транзакции
// ============================================================================

class PgReadWriteTransaction : public storage::IReadWriteTransaction {
public:
    explicit PgReadWriteTransaction(const std::string& connectionString)
        : conn_(connectionString), tx_(std::make_unique<SerializableWork>(conn_)) {}

    std::optional<Row> readRow(const std::string& table, const std::string& key) override {
        return translateConflicts([&] { return selectRow(active(), table, key); });
    }

    std::vector<Row> query(const std::string& table, const std::string& field, const Row& value) override {
        return translateConflicts([&] { return selectWhere(active(), table, field, value); });
    }

    std::vector<Row> readAll(const std::string& table) override {
        return translateConflicts([&] { return selectAll(active(), table); });
    }

    void bufferWrite(const std::vector<Mutation>& mutations) override {
        translateConflicts([&] { execMutations(active(), mutations); });
    }

    void commit() {
        translateConflicts([&] { active().commit(); });
        tx_.reset();
    }

    /// Откат, если транзакция ещё открыта
    void finish() {
        tx_.reset();
    }

private:
    SerializableWork& active() {
        if (!tx_) {
            throw transaction::TransactionException("transaction already finished");
        }
        return *tx_;
    }

    pqxx::connection conn_;
    std::unique_ptr<SerializableWork> tx_;
};

class PgReadOnlyTransaction : public storage::IReadOnlyTransaction {
public:
    explicit PgReadOnlyTransaction(const std::string& connectionString)
        : conn_(connectionString), tx_(std::make_unique<pqxx::read_transaction>(conn_)) {}

    std::optional<Row> readRow(const std::string& table, const std::string& key) override {
        return selectRow(active(), table, key);
    }

    std::vector<Row> query(const std::string& table, const std::string& field, const Row& value) override {
        return selectWhere(active(), table, field, value);
    }

    std::vector<Row> readAll(const std::string& table) override {
        return selectAll(active(), table);
    }

    void close() override {
        tx_.reset();
    }

private:
    pqxx::read_transaction& active() {
        if (!tx_) {
            throw transaction::TransactionException("read-only transaction already closed");
        }
        return *tx_;
    }

    pqxx::connection conn_;
    std::unique_ptr<pqxx::read_transaction> tx_;
};

} // namespace

// ============================================================================
// PostgresDatabase
// ============================================================================

PostgresDatabase::PostgresDatabase(std::shared_ptr<settings::DbSettings> dbSettings,
                                   std::shared_ptr<settings::AppSettings> appSettings)
    : dbSettings_(std::move(dbSettings))
    , maxAttempts_(appSettings->getMaxTransactionAttempts())
{
    ensureSchema();
    std::cout << "[PostgresDatabase] Connected to " << dbSettings_->describe() << std::endl;
}

const std::vector<std::string>& PostgresDatabase::tables() {
    static const std::vector<std::string> names{"users", "orders"};
    return names;
}

void PostgresDatabase::ensureSchema() {
    pqxx::connection c(dbSettings_->getConnectionString());
    pqxx::work t(c);
    for (const auto& table : tables()) {
        t.exec("CREATE TABLE IF NOT EXISTS " + t.quote_name(table) +
               " (id TEXT PRIMARY KEY, body JSONB NOT NULL)");
    }
    t.commit();
}

void PostgresDatabase::runReadWrite(const Context& ctx, const ReadWriteWork& work) {
    for (int attempt = 1;; ++attempt) {
        ctx.throwIfCancelled();

        auto tx = std::make_shared<PgReadWriteTransaction>(dbSettings_->getConnectionString());
        try {
            work(tx);
            tx->commit();
            return;
        } catch (const transaction::TransactionAbortedException& e) {
            tx->finish();
            if (!shouldRetry(attempt, e.what())) {
                throw;
            }
        } catch (const std::exception&) {
            tx->finish();
            throw;
        }
    }
}

bool PostgresDatabase::shouldRetry(int attempt, const std::string& reason) const {
    if (attempt >= maxAttempts_) {
        std::cerr << "[PostgresDatabase] Giving up after " << attempt << " attempt(s): " << reason << std::endl;
        return false;
    }
    std::cout << "[PostgresDatabase] Retrying transaction (attempt " << attempt + 1
              << " of " << maxAttempts_ << "): " << reason << std::endl;
    return true;
}

std::shared_ptr<storage::IReadOnlyTransaction> PostgresDatabase::beginReadOnly() {
    return std::make_shared<PgReadOnlyTransaction>(dbSettings_->getConnectionString());
}

void PostgresDatabase::apply(const std::vector<storage::Mutation>& mutations) {
    pqxx::connection c(dbSettings_->getConnectionString());
    pqxx::work t(c);
    execMutations(t, mutations);
    t.commit();
}

} // namespace monolith::adapters::secondary
