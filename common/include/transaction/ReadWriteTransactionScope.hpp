#pragma once

#include "transaction/ITransactionScope.hpp"
#include "transaction/TransactionContext.hpp"
#include "storage/IDatabaseClient.hpp"
#include <memory>
#include <stdexcept>

namespace monolith::transaction {

/**
 * @brief Read-write граница транзакции
 *
 * Каждая попытка получает новую транзакцию и новый дочерний контекст.
 * Повторы при конфликтах выполняет хранилище.
 *
 * @throws NestedTransactionException если ctx уже несёт транзакцию
 */
class ReadWriteTransactionScope : public ITransactionScope {
public:
    explicit ReadWriteTransactionScope(std::shared_ptr<storage::IDatabaseClient> client)
        : client_(std::move(client))
    {
        if (!client_) {
            throw std::invalid_argument("ReadWriteTransactionScope requires a database client");
        }
    }

    void execute(const Context& ctx, const Work& fn) override {
        if (hasTransaction(ctx)) {
            throw NestedTransactionException();
        }
        client_->runReadWrite(ctx, [&](const std::shared_ptr<storage::IReadWriteTransaction>& tx) {
            fn(withReadWriteTx(ctx, tx));
        });
    }

private:
    std::shared_ptr<storage::IDatabaseClient> client_;
};

} // namespace monolith::transaction
