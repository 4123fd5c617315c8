#include "MonolithApp.hpp"

#include <boost/di.hpp>

// Settings
#include "settings/AppSettings.hpp"
#include "settings/DbSettings.hpp"

// Core
#include "Context.hpp"
#include "events/EventHandlerRegistry.hpp"
#include "events/InMemoryEventBus.hpp"
#include "events/contracts/OrderEvents.hpp"
#include "events/contracts/UserEvents.hpp"
#include "storage/InMemoryDatabase.hpp"
#include "transaction/ReadOnlyTransactionScope.hpp"
#include "transaction/ReadWriteTransactionScope.hpp"

// Primary Adapters
#include "adapters/primary/ConsoleCommandHandler.hpp"

// Secondary Adapters
#include "adapters/secondary/storage/PostgresDatabase.hpp"
#include "users/adapters/secondary/DatabaseUserRepository.hpp"
#include "orders/adapters/secondary/DatabaseOrderRepository.hpp"
#include "notifications/adapters/secondary/ConsoleNotificationSender.hpp"

// Application Services & Handlers
#include "users/application/UserService.hpp"
#include "orders/application/OrderService.hpp"
#include "orders/application/handlers/UserDeletedEventHandler.hpp"
#include "notifications/application/handlers/OrderSubmittedEventHandler.hpp"

#include <iostream>
#include <string>

namespace di = boost::di;

namespace monolith {

MonolithApp::MonolithApp()
    : cancellation_(std::make_shared<CancellationToken>())
{
    std::cout << "[MonolithApp] Application created" << std::endl;
}

MonolithApp::~MonolithApp()
{
    std::cout << "[MonolithApp] Application destroyed" << std::endl;
}

void MonolithApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
}

void MonolithApp::stop()
{
    running_.store(false);
    cancellation_->cancel();
}

void MonolithApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[MonolithApp] Loading environment..." << std::endl;

    appSettings_ = std::make_shared<settings::AppSettings>();
    dbSettings_ = std::make_shared<settings::DbSettings>();

    for (int i = 1; i < argc; ++i)
    {
        std::cout << "[MonolithApp] Ignoring argument: " << argv[i] << std::endl;
    }

    std::cout << "[MonolithApp] Environment loaded: storage=" << appSettings_->getStorageName()
              << ", max event depth=" << appSettings_->getMaxEventDepth()
              << ", max tx attempts=" << appSettings_->getMaxTransactionAttempts() << std::endl;
}

void MonolithApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[MonolithApp] Configuring Boost.DI injection..." << std::endl;

    // ========================================================================
    // Хранилище и шины событий
    // ========================================================================

    if (appSettings_->getStorage() == settings::StorageBackend::POSTGRES)
    {
        database_ = std::make_shared<adapters::secondary::PostgresDatabase>(dbSettings_, appSettings_);
    }
    else
    {
        database_ = std::make_shared<storage::InMemoryDatabase>(appSettings_->getMaxTransactionAttempts());
    }

    handlerRegistry_ = std::make_shared<events::EventHandlerRegistry>();
    postCommitBus_ = std::make_shared<events::InMemoryEventBus>();

    std::shared_ptr<events::IHandlerRegistry> registryPort = handlerRegistry_;
    std::shared_ptr<events::IEventPublisher> postCommitPort = postCommitBus_;

    // ========================================================================
    // Boost.DI Injector Configuration
    // ========================================================================

    auto injector = di::make_injector(

        // Settings
        di::bind<settings::AppSettings>().to(appSettings_),
        di::bind<settings::DbSettings>().to(dbSettings_),

        // Storage + transactions
        di::bind<storage::IDatabaseClient>().to(database_),
        di::bind<transaction::ITransactionScope>()
            .to<transaction::ReadWriteTransactionScope>()
            .in(di::singleton),
        di::bind<transaction::ReadOnlyTransactionScope>().in(di::singleton),

        // Events
        di::bind<events::IHandlerRegistry>().to(registryPort),
        di::bind<events::IEventPublisher>().to(postCommitPort),

        // users
        di::bind<users::ports::output::IUserRepository>()
            .to<users::adapters::secondary::DatabaseUserRepository>()
            .in(di::singleton),
        di::bind<users::ports::input::IUserService>()
            .to<users::application::UserService>()
            .in(di::singleton),

        // orders
        di::bind<orders::ports::output::IOrderRepository>()
            .to<orders::adapters::secondary::DatabaseOrderRepository>()
            .in(di::singleton),
        di::bind<orders::ports::input::IOrderService>()
            .to<orders::application::OrderService>()
            .in(di::singleton),

        // notifications
        di::bind<notifications::ports::output::INotificationSender>()
            .to<notifications::adapters::secondary::ConsoleNotificationSender>()
            .in(di::singleton)
    );

    // ========================================================================
    // Подписки модулей
    // ========================================================================

    // Транзакционные: выполняются внутри транзакции команды
    handlerRegistry_->subscribe(events::contracts::USER_DELETED,
        injector.create<std::shared_ptr<orders::application::handlers::UserDeletedEventHandler>>());

    // Post-commit: внешние побочные эффекты
    postCommitBus_->subscribe(events::contracts::ORDER_SUBMITTED,
        std::make_shared<notifications::application::handlers::OrderSubmittedEventHandler>(
            injector.create<std::shared_ptr<notifications::ports::output::INotificationSender>>()));

    // ========================================================================
    // Primary Adapter
    // ========================================================================

    consoleHandler_ = injector.create<std::shared_ptr<adapters::primary::ConsoleCommandHandler>>();

    std::cout << "[MonolithApp] Injection configured: "
              << handlerRegistry_->handlerCount(events::contracts::USER_DELETED)
              << " transactional handler(s) for " << events::contracts::USER_DELETED.str() << std::endl;
}

void MonolithApp::start()
{
    running_.store(true);
    std::cout << "[MonolithApp] Ready. Type 'help' for commands, 'quit' to exit." << std::endl;

    auto ctx = Context::background().withCancellation(cancellation_);

    std::string line;
    while (running_.load() && std::getline(std::cin, line))
    {
        if (line == "quit" || line == "exit")
        {
            break;
        }
        if (line.empty())
        {
            continue;
        }
        std::cout << consoleHandler_->handle(ctx, line) << std::endl;
    }

    running_.store(false);
    std::cout << "[MonolithApp] Console loop finished" << std::endl;
}

void MonolithApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "+------------------------------------------------------+" << std::endl;
    std::cout << "|  Modular Monolith: users / orders / notifications    |" << std::endl;
    std::cout << "|                                                      |" << std::endl;
    std::cout << "|  Architecture: Hexagonal modules, shared kernel      |" << std::endl;
    std::cout << "|  DI Framework: Boost.DI                              |" << std::endl;
    std::cout << "|  Events:       transactional bus + post-commit bus   |" << std::endl;
    std::cout << "+------------------------------------------------------+" << std::endl;
    std::cout << "  Storage: " << appSettings_->getStorageName() << std::endl;
    std::cout << std::endl;
}

} // namespace monolith
