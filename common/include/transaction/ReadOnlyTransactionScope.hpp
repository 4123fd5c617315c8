#pragma once

#include "transaction/ITransactionScope.hpp"
#include "transaction/TransactionContext.hpp"
#include "storage/IDatabaseClient.hpp"
#include <memory>
#include <stdexcept>

namespace monolith::transaction {

/**
 * @brief Read-only граница транзакции над согласованным снимком
 *
 * Транзакция закрывается при выходе из execute() независимо от исхода.
 * Повторов нет.
 */
class ReadOnlyTransactionScope : public ITransactionScope {
public:
    explicit ReadOnlyTransactionScope(std::shared_ptr<storage::IDatabaseClient> client)
        : client_(std::move(client))
    {
        if (!client_) {
            throw std::invalid_argument("ReadOnlyTransactionScope requires a database client");
        }
    }

    void execute(const Context& ctx, const Work& fn) override {
        if (hasTransaction(ctx)) {
            throw NestedTransactionException();
        }
        ctx.throwIfCancelled();

        auto tx = client_->beginReadOnly();
        storage::ReadOnlyTransactionGuard guard(tx);
        fn(withReadOnlyTx(ctx, tx));
    }

private:
    std::shared_ptr<storage::IDatabaseClient> client_;
};

} // namespace monolith::transaction
