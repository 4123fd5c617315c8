#pragma once

#include "CancellationToken.hpp"
#include <atomic>
#include <memory>

namespace monolith::settings {
    class AppSettings;
    class DbSettings;
}

namespace monolith::storage {
    class IDatabaseClient;
}

namespace monolith::events {
    class EventHandlerRegistry;
    class InMemoryEventBus;
}

namespace monolith::adapters::primary {
    class ConsoleCommandHandler;
}

namespace monolith {

/**
 * @class MonolithApp
 * @brief Главное приложение модульного монолита users/orders
 *
 * Template Method:
 * 1. loadEnvironment() - чтение AppSettings/DbSettings из окружения
 * 2. configureInjection() - Boost.DI и подписка обработчиков модулей
 * 3. start() - консольный цикл команд (до EOF, "quit" или stop())
 *
 * Два пути доставки событий:
 * - EventHandlerRegistry: транзакционные обработчики (users.UserDeleted → orders)
 * - InMemoryEventBus: побочные эффекты после коммита (orders.OrderSubmitted → notifications)
 */
class MonolithApp
{
public:
    MonolithApp();
    ~MonolithApp();

    /**
     * @brief Запустить приложение (loadEnvironment → configureInjection → start)
     */
    void run(int argc, char* argv[]);

    /**
     * @brief Остановить консольный цикл и отменить текущую команду
     *
     * Безопасен для вызова из обработчика сигнала.
     */
    void stop();

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    void start();

private:
    void printStartupBanner();

    std::shared_ptr<settings::AppSettings> appSettings_;
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<storage::IDatabaseClient> database_;
    std::shared_ptr<events::EventHandlerRegistry> handlerRegistry_;
    std::shared_ptr<events::InMemoryEventBus> postCommitBus_;
    std::shared_ptr<adapters::primary::ConsoleCommandHandler> consoleHandler_;

    std::shared_ptr<CancellationToken> cancellation_;
    std::atomic<bool> running_{false};
};

} // namespace monolith
