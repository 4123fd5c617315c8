#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

/**
 * @file CancellationToken.hpp
 * @brief Токен отмены операции, передаваемый через Context
 */

namespace monolith {

/**
 * @brief Исключение, выбрасываемое при обращении к отменённому контексту
 */
class OperationCancelledException : public std::runtime_error {
public:
    OperationCancelledException()
        : std::runtime_error("operation was cancelled") {}
};

/**
 * @brief Флаг отмены, разделяемый между вызывающим кодом и контекстами
 *
 * Потокобезопасен: cancel() может вызываться из обработчика сигнала
 * или другого потока.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool isCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @throws OperationCancelledException если токен отменён
     */
    void throwIfCancelled() const {
        if (isCancelled()) {
            throw OperationCancelledException();
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace monolith
