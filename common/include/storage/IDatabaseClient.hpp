#pragma once

#include "Context.hpp"
#include "storage/ITransaction.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace monolith::storage {

/**
 * @brief Порт хранилища с транзакциями
 */
class IDatabaseClient {
public:
    using ReadWriteWork = std::function<void(const std::shared_ptr<IReadWriteTransaction>&)>;

    virtual ~IDatabaseClient() = default;

    /**
     * @brief Выполнить work в read-write транзакции
     *
     * Каждая попытка получает новую транзакцию. Если work завершился
     * без исключения, транзакция коммитится. При TransactionAbortedException
     * (из work или из коммита) work вызывается повторно, пока не исчерпан
     * лимит попыток. Любое другое исключение откатывает транзакцию
     * и пробрасывается без изменений.
     *
     * @throws OperationCancelledException если ctx отменён перед попыткой
     */
    virtual void runReadWrite(const Context& ctx, const ReadWriteWork& work) = 0;

    /// Открыть read-only транзакцию
    virtual std::shared_ptr<IReadOnlyTransaction> beginReadOnly() = 0;

    /**
     * @brief Атомарно применить мутации вне транзакции
     */
    virtual void apply(const std::vector<Mutation>& mutations) = 0;
};

} // namespace monolith::storage
