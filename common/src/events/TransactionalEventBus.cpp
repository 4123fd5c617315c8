#include "events/TransactionalEventBus.hpp"
#include "events/EventExceptions.hpp"
#include "transaction/TransactionExceptions.hpp"
#include <exception>
#include <iostream>
#include <stdexcept>

namespace monolith::events {

namespace {

/// Сбрасывает флаг flush() при любом выходе из него
class FlushingGuard {
public:
    explicit FlushingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~FlushingGuard() { flag_.store(false); }

    FlushingGuard(const FlushingGuard&) = delete;
    FlushingGuard& operator=(const FlushingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

TransactionalEventBus::TransactionalEventBus(std::shared_ptr<const IHandlerRegistry> registry, int maxDepth)
    : registry_(std::move(registry))
    , maxDepth_(maxDepth > 0 ? maxDepth : DEFAULT_MAX_DEPTH)
{
    if (!registry_) {
        throw std::invalid_argument("TransactionalEventBus requires a handler registry");
    }
}

void TransactionalEventBus::publish(const Context& /*ctx*/, DomainEventPtr event) {
    if (!event) {
        throw std::invalid_argument("cannot publish null event");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(event));
}

void TransactionalEventBus::publishAll(const Context& ctx, const std::vector<DomainEventPtr>& events) {
    for (const auto& event : events) {
        publish(ctx, event);
    }
}

void TransactionalEventBus::flush(const Context& ctx) {
    if (flushing_.exchange(true)) {
        return;
    }
    FlushingGuard guard(flushing_);

    std::unique_lock<std::mutex> lock(mutex_);
    depth_ = 0;

    while (!pending_.empty()) {
        if (depth_ >= maxDepth_) {
            std::cerr << "[TransactionalEventBus] Depth limit " << maxDepth_
                      << " reached, " << pending_.size() << " event(s) left unprocessed" << std::endl;
            throw EventProcessingDepthExceededException(maxDepth_);
        }
        ++depth_;

        DomainEventPtr event = std::move(pending_.front());
        pending_.pop_front();
        auto handlers = registry_->handlersFor(event->eventType());

        // Обработчики могут публиковать: мьютекс на время вызова отпущен
        lock.unlock();
        dispatch(ctx, *event, handlers);
        lock.lock();
    }
}

void TransactionalEventBus::dispatch(const Context& ctx,
                                     const DomainEvent& event,
                                     const std::vector<EventHandlerPtr>& handlers) {
    Context handlerCtx = withEventPublisher(ctx, this);

    for (const auto& handler : handlers) {
        try {
            handler->handle(handlerCtx, event);
        } catch (const transaction::TransactionAbortedException&) {
            throw;
        } catch (const OperationCancelledException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[TransactionalEventBus] Handler failed for " << event.eventType().str()
                      << " (" << event.eventId() << "): " << e.what() << std::endl;
            std::throw_with_nested(EventHandlerException(event.eventType().str(), e.what()));
        }
    }
}

size_t TransactionalEventBus::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace monolith::events
