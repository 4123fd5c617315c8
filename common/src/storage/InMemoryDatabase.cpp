#include "storage/InMemoryDatabase.hpp"
#include "transaction/TransactionExceptions.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace monolith::storage {

namespace {

bool matches(const Row& row, const std::string& field, const Row& value) {
    if (!row.is_object()) {
        return false;
    }
    auto it = row.find(field);
    return it != row.end() && *it == value;
}

void validateMutations(const std::vector<Mutation>& mutations) {
    for (const auto& m : mutations) {
        if (m.table.empty() || m.key.empty()) {
            throw std::invalid_argument("mutation requires table and key");
        }
    }
}

} // namespace

// ============================================================================
// ReadWriteTransaction
// ============================================================================

class InMemoryDatabase::ReadWriteTransaction : public IReadWriteTransaction {
public:
    explicit ReadWriteTransaction(std::shared_ptr<const Snapshot> snapshot)
        : snapshot_(std::move(snapshot)) {}

    std::optional<Row> readRow(const std::string& table, const std::string& key) override {
        requireActive();

        // Собственные записи видны сразу
        for (auto it = mutations_.rbegin(); it != mutations_.rend(); ++it) {
            if (it->table == table && it->key == key) {
                if (it->kind == Mutation::Kind::DELETE) {
                    return std::nullopt;
                }
                return it->row;
            }
        }

        uint64_t version = 0;
        std::optional<Row> result;
        auto t = snapshot_->find(table);
        if (t != snapshot_->end()) {
            auto r = t->second.rows.find(key);
            if (r != t->second.rows.end()) {
                version = r->second.version;
                result = r->second.row;
            }
        }
        readKeys_.emplace(std::make_pair(table, key), version);
        return result;
    }

    std::vector<Row> query(const std::string& table, const std::string& field, const Row& value) override {
        std::vector<Row> result;
        for (auto& [key, row] : mergedRows(table)) {
            if (matches(row, field, value)) {
                result.push_back(std::move(row));
            }
        }
        return result;
    }

    std::vector<Row> readAll(const std::string& table) override {
        std::vector<Row> result;
        for (auto& [key, row] : mergedRows(table)) {
            result.push_back(std::move(row));
        }
        return result;
    }

    void bufferWrite(const std::vector<Mutation>& mutations) override {
        requireActive();
        validateMutations(mutations);
        mutations_.insert(mutations_.end(), mutations.begin(), mutations.end());
    }

    void finish() { active_ = false; }

private:
    friend class InMemoryDatabase;

    void requireActive() const {
        if (!active_) {
            throw transaction::TransactionException("read-write transaction is no longer active");
        }
    }

    std::map<std::string, Row> mergedRows(const std::string& table) {
        requireActive();

        std::map<std::string, Row> rows;
        uint64_t version = 0;
        auto t = snapshot_->find(table);
        if (t != snapshot_->end()) {
            version = t->second.version;
            for (const auto& [key, versioned] : t->second.rows) {
                rows.emplace(key, versioned.row);
            }
        }
        readTables_.emplace(table, version);

        for (const auto& m : mutations_) {
            if (m.table != table) continue;
            if (m.kind == Mutation::Kind::DELETE) {
                rows.erase(m.key);
            } else {
                rows[m.key] = m.row;
            }
        }
        return rows;
    }

    std::shared_ptr<const Snapshot> snapshot_;
    std::vector<Mutation> mutations_;
    std::map<std::pair<std::string, std::string>, uint64_t> readKeys_;
    std::map<std::string, uint64_t> readTables_;
    bool active_ = true;
};

// ============================================================================
// ReadOnlyTransaction
// ============================================================================

class InMemoryDatabase::ReadOnlyTransaction : public IReadOnlyTransaction {
public:
    ReadOnlyTransaction(std::shared_ptr<const Snapshot> snapshot, std::shared_ptr<std::atomic<int>> openCounter)
        : snapshot_(std::move(snapshot))
        , openCounter_(std::move(openCounter))
    {
        ++*openCounter_;
    }

    ~ReadOnlyTransaction() override {
        close();
    }

    std::optional<Row> readRow(const std::string& table, const std::string& key) override {
        const Table* t = findTable(table);
        if (!t) {
            return std::nullopt;
        }
        auto r = t->rows.find(key);
        if (r == t->rows.end()) {
            return std::nullopt;
        }
        return r->second.row;
    }

    std::vector<Row> query(const std::string& table, const std::string& field, const Row& value) override {
        std::vector<Row> result;
        if (const Table* t = findTable(table)) {
            for (const auto& [key, versioned] : t->rows) {
                if (matches(versioned.row, field, value)) {
                    result.push_back(versioned.row);
                }
            }
        }
        return result;
    }

    std::vector<Row> readAll(const std::string& table) override {
        std::vector<Row> result;
        if (const Table* t = findTable(table)) {
            for (const auto& [key, versioned] : t->rows) {
                result.push_back(versioned.row);
            }
        }
        return result;
    }

    void close() override {
        if (!closed_.exchange(true)) {
            --*openCounter_;
            snapshot_.reset();
        }
    }

private:
    const Table* findTable(const std::string& table) const {
        if (closed_) {
            throw transaction::TransactionException("read-only transaction is closed");
        }
        auto t = snapshot_->find(table);
        return t != snapshot_->end() ? &t->second : nullptr;
    }

    std::shared_ptr<const Snapshot> snapshot_;
    std::shared_ptr<std::atomic<int>> openCounter_;
    std::atomic<bool> closed_{false};
};

// ============================================================================
// InMemoryDatabase
// ============================================================================

InMemoryDatabase::InMemoryDatabase(int maxAttempts)
    : maxAttempts_(maxAttempts > 0 ? maxAttempts : DEFAULT_MAX_ATTEMPTS)
    , state_(std::make_shared<const Snapshot>())
    , openReadOnly_(std::make_shared<std::atomic<int>>(0))
{}

void InMemoryDatabase::runReadWrite(const Context& ctx, const ReadWriteWork& work) {
    for (int attempt = 1;; ++attempt) {
        ctx.throwIfCancelled();

        auto tx = std::make_shared<ReadWriteTransaction>(snapshot());
        try {
            work(tx);
            commit(*tx);
            tx->finish();
            return;
        } catch (const transaction::TransactionAbortedException& e) {
            tx->finish();
            if (attempt >= maxAttempts_) {
                std::cerr << "[InMemoryDatabase] Giving up after " << attempt
                          << " attempt(s): " << e.what() << std::endl;
                throw;
            }
            std::cout << "[InMemoryDatabase] Retrying transaction (attempt " << attempt + 1
                      << " of " << maxAttempts_ << "): " << e.what() << std::endl;
        } catch (const std::exception&) {
            // Откат: буфер записей просто отбрасывается
            tx->finish();
            throw;
        }
    }
}

std::shared_ptr<IReadOnlyTransaction> InMemoryDatabase::beginReadOnly() {
    return std::make_shared<ReadOnlyTransaction>(snapshot(), openReadOnly_);
}

void InMemoryDatabase::apply(const std::vector<Mutation>& mutations) {
    validateMutations(mutations);
    std::lock_guard<std::mutex> lock(mutex_);
    applyLocked(mutations);
}

int InMemoryDatabase::openReadOnlyCount() const {
    return openReadOnly_->load();
}

uint64_t InMemoryDatabase::commitCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commitSeq_;
}

std::shared_ptr<const InMemoryDatabase::Snapshot> InMemoryDatabase::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void InMemoryDatabase::commit(ReadWriteTransaction& tx) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& [tableKey, version] : tx.readKeys_) {
        uint64_t current = 0;
        auto t = state_->find(tableKey.first);
        if (t != state_->end()) {
            auto r = t->second.rows.find(tableKey.second);
            if (r != t->second.rows.end()) {
                current = r->second.version;
            }
        }
        if (current != version) {
            throw transaction::TransactionAbortedException(
                "row " + tableKey.first + "/" + tableKey.second + " was modified concurrently");
        }
    }

    for (const auto& [table, version] : tx.readTables_) {
        auto t = state_->find(table);
        uint64_t current = t != state_->end() ? t->second.version : 0;
        if (current != version) {
            throw transaction::TransactionAbortedException(
                "table " + table + " was modified concurrently");
        }
    }

    if (!tx.mutations_.empty()) {
        applyLocked(tx.mutations_);
    }
}

void InMemoryDatabase::applyLocked(const std::vector<Mutation>& mutations) {
    auto next = std::make_shared<Snapshot>(*state_);
    ++commitSeq_;

    for (const auto& m : mutations) {
        Table& table = (*next)[m.table];
        table.version = commitSeq_;
        if (m.kind == Mutation::Kind::DELETE) {
            table.rows.erase(m.key);
        } else {
            table.rows[m.key] = VersionedRow{m.row, commitSeq_};
        }
    }

    state_ = std::move(next);
}

} // namespace monolith::storage
