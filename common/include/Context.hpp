#pragma once

#include "CancellationToken.hpp"
#include <memory>

/**
 * @file Context.hpp
 * @brief Контекст запроса: отмена, активная транзакция, активный publisher
 */

namespace monolith {

namespace storage {
    class IReadWriteTransaction;
    class IReadOnlyTransaction;
}

namespace events {
    class IEventPublisher;
}

class Context;

namespace transaction {
    Context withReadWriteTx(const Context& ctx, std::shared_ptr<storage::IReadWriteTransaction> tx);
    Context withReadOnlyTx(const Context& ctx, std::shared_ptr<storage::IReadOnlyTransaction> tx);
    std::shared_ptr<storage::IReadWriteTransaction> readWriteTxFromContext(const Context& ctx);
    std::shared_ptr<storage::IReadOnlyTransaction> readOnlyTxFromContext(const Context& ctx);
}

namespace events {
    Context withEventPublisher(const Context& ctx, IEventPublisher* publisher);
    IEventPublisher* publisherFromContext(const Context& ctx);
}

/**
 * @brief Неизменяемый контекст операции
 *
 * Копируется по значению. Каждое "добавление" значения создаёт новый
 * дочерний контекст, исходный не меняется.
 *
 * Содержит:
 * - токен отмены (единственный канал отмены);
 * - не более одной транзакции (read-write или read-only);
 * - publisher, активный на время flush() транзакционной шины.
 *
 * Слоты транзакции и publisher'а доступны только через функции
 * transaction::* и events::*, которые проверяют свои инварианты.
 */
class Context {
public:
    Context() : cancellation_(std::make_shared<CancellationToken>()) {}

    /**
     * @brief Корневой контекст без транзакции и без отмены
     */
    static Context background() {
        return Context();
    }

    /**
     * @brief Дочерний контекст с заданным токеном отмены
     */
    Context withCancellation(std::shared_ptr<CancellationToken> token) const {
        Context child = *this;
        child.cancellation_ = token ? std::move(token) : std::make_shared<CancellationToken>();
        return child;
    }

    const std::shared_ptr<CancellationToken>& cancellationToken() const {
        return cancellation_;
    }

    bool isCancelled() const {
        return cancellation_->isCancelled();
    }

    /**
     * @throws OperationCancelledException
     */
    void throwIfCancelled() const {
        cancellation_->throwIfCancelled();
    }

private:
    friend Context transaction::withReadWriteTx(const Context&, std::shared_ptr<storage::IReadWriteTransaction>);
    friend Context transaction::withReadOnlyTx(const Context&, std::shared_ptr<storage::IReadOnlyTransaction>);
    friend std::shared_ptr<storage::IReadWriteTransaction> transaction::readWriteTxFromContext(const Context&);
    friend std::shared_ptr<storage::IReadOnlyTransaction> transaction::readOnlyTxFromContext(const Context&);
    friend Context events::withEventPublisher(const Context&, events::IEventPublisher*);
    friend events::IEventPublisher* events::publisherFromContext(const Context&);

    std::shared_ptr<CancellationToken> cancellation_;
    std::shared_ptr<storage::IReadWriteTransaction> readWriteTx_;
    std::shared_ptr<storage::IReadOnlyTransaction> readOnlyTx_;
    events::IEventPublisher* publisher_ = nullptr;  ///< не владеет, действителен только внутри flush()
};

} // namespace monolith
