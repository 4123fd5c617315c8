#pragma once

#include "events/IEventPublisher.hpp"
#include "events/IHandlerRegistry.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace monolith::events {

/**
 * @brief Транзакционный диспетчер событий: буферизация + flush
 *
 * Жизненный цикл: один экземпляр на одну попытку транзакции.
 * Создаётся внутри замыкания ITransactionScope::execute(), чтобы при
 * повторе транзакции очередь начиналась пустой.
 *
 * publish() только добавляет событие в очередь.
 * flush() вычерпывает очередь в порядке FIFO и синхронно вызывает
 * обработчики в порядке подписки. События, опубликованные
 * обработчиками, попадают в ту же очередь и обрабатываются тем же
 * flush(). Первая ошибка обработчика прерывает flush().
 *
 * Защита от циклов: не более maxDepth событий за один flush().
 */
class TransactionalEventBus : public IEventPublisher {
public:
    static constexpr int DEFAULT_MAX_DEPTH = 10;

    /**
     * @param registry Реестр обработчиков
     * @param maxDepth Лимит событий за flush(), значение <= 0 означает DEFAULT_MAX_DEPTH
     */
    explicit TransactionalEventBus(std::shared_ptr<const IHandlerRegistry> registry,
                                   int maxDepth = DEFAULT_MAX_DEPTH);

    TransactionalEventBus(const TransactionalEventBus&) = delete;
    TransactionalEventBus& operator=(const TransactionalEventBus&) = delete;

    /**
     * @brief Поставить событие в очередь (без диспетчеризации)
     * @throws std::invalid_argument если event == nullptr
     */
    void publish(const Context& ctx, DomainEventPtr event) override;

    /**
     * @brief Поставить в очередь события агрегата в исходном порядке
     */
    void publishAll(const Context& ctx, const std::vector<DomainEventPtr>& events);

    /**
     * @brief Обработать все события в очереди
     *
     * Вызов flush() из обработчика во время flush() ничего не делает:
     * внешний цикл сам обработает новые события.
     *
     * @throws EventProcessingDepthExceededException при превышении maxDepth
     * @throws EventHandlerException с вложенной исходной ошибкой
     */
    void flush(const Context& ctx);

    /// Количество событий в очереди
    size_t pendingCount() const;

    int getMaxDepth() const { return maxDepth_; }

private:
    void dispatch(const Context& ctx, const DomainEvent& event, const std::vector<EventHandlerPtr>& handlers);

    std::shared_ptr<const IHandlerRegistry> registry_;
    int maxDepth_;

    mutable std::mutex mutex_;
    std::deque<DomainEventPtr> pending_;
    int depth_ = 0;
    std::atomic<bool> flushing_{false};
};

} // namespace monolith::events
