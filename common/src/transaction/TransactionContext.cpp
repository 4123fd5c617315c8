#include "transaction/TransactionContext.hpp"
#include <stdexcept>

namespace monolith::transaction {

Context withReadWriteTx(const Context& ctx, std::shared_ptr<storage::IReadWriteTransaction> tx) {
    if (!tx) {
        throw std::invalid_argument("cannot attach null read-write transaction to context");
    }
    if (hasTransaction(ctx)) {
        throw NestedTransactionException();
    }
    Context child = ctx;
    child.readWriteTx_ = std::move(tx);
    return child;
}

Context withReadOnlyTx(const Context& ctx, std::shared_ptr<storage::IReadOnlyTransaction> tx) {
    if (!tx) {
        throw std::invalid_argument("cannot attach null read-only transaction to context");
    }
    if (hasTransaction(ctx)) {
        throw NestedTransactionException();
    }
    Context child = ctx;
    child.readOnlyTx_ = std::move(tx);
    return child;
}

std::shared_ptr<storage::IReadWriteTransaction> readWriteTxFromContext(const Context& ctx) {
    return ctx.readWriteTx_;
}

std::shared_ptr<storage::IReadOnlyTransaction> readOnlyTxFromContext(const Context& ctx) {
    return ctx.readOnlyTx_;
}

std::shared_ptr<storage::IReadCapability> readCapabilityFromContext(const Context& ctx) {
    if (auto tx = readWriteTxFromContext(ctx)) {
        return tx;
    }
    if (auto tx = readOnlyTxFromContext(ctx)) {
        return tx;
    }
    return nullptr;
}

bool hasTransaction(const Context& ctx) {
    return readCapabilityFromContext(ctx) != nullptr;
}

} // namespace monolith::transaction
