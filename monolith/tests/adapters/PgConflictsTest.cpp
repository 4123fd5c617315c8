/**
 * @file PgConflictsTest.cpp
 * @brief Конфликты PostgreSQL внутри обработчиков приводят к повтору транзакции
 */

#include <gtest/gtest.h>
#include "adapters/secondary/storage/PgConflicts.hpp"
#include "events/EventExceptions.hpp"
#include "events/IEventHandler.hpp"
#include "events/TransactionalEventBus.hpp"
#include "mocks/TestModules.hpp"
#include <pqxx/except>
#include <atomic>

using namespace monolith;
using namespace monolith::tests;
using monolith::adapters::secondary::translateConflicts;

// ============================================================================
// translateConflicts
// ============================================================================

TEST(PgConflictsTest, SerializationFailure_BecomesAborted) {
    EXPECT_THROW(
        translateConflicts([] { throw pqxx::serialization_failure("could not serialize access"); }),
        transaction::TransactionAbortedException);
}

TEST(PgConflictsTest, Deadlock_BecomesAborted) {
    EXPECT_THROW(
        translateConflicts([] { throw pqxx::deadlock_detected("deadlock detected"); }),
        transaction::TransactionAbortedException);
}

TEST(PgConflictsTest, OtherErrors_PassThrough) {
    EXPECT_THROW(
        translateConflicts([] { throw std::runtime_error("connection lost"); }),
        std::runtime_error);
}

TEST(PgConflictsTest, ReturnsValue) {
    EXPECT_EQ(translateConflicts([] { return 42; }), 42);
}

// ============================================================================
// Конфликт в обработчике каскада
// ============================================================================

class HandlerConflictTest : public ::testing::Test {
protected:
    void SetUp() override {
        userId_ = modules_.userService->createUser(modules_.ctx(), "owner@example.com", "Maria", "Orlova");
        orderId_ = modules_.createPendingOrder(userId_);

        // Второй обработчик падает с конфликтом сериализации на первой попытке
        modules_.registry->subscribe(events::contracts::USER_DELETED,
            std::make_shared<events::EventHandlerFunc>([this](const Context&, const events::DomainEvent&) {
                if (calls_.fetch_add(1) == 0) {
                    translateConflicts([] { throw pqxx::serialization_failure("could not serialize access"); });
                }
            }));
    }

    TestModules modules_;
    std::string userId_;
    std::string orderId_;
    std::atomic<int> calls_{0};
};

TEST_F(HandlerConflictTest, ConflictInHandler_RetriesWholeTransaction) {
    EXPECT_NO_THROW(modules_.userService->deleteUser(modules_.ctx(), userId_));

    EXPECT_EQ(calls_.load(), 2);
    EXPECT_EQ(modules_.userService->getUser(modules_.ctx(), userId_).status(),
              users::domain::UserStatus::DELETED);
    EXPECT_EQ(modules_.orderService->getOrder(modules_.ctx(), orderId_).status(),
              orders::domain::OrderStatus::CANCELLED);
}

TEST(PgConflictsDispatchTest, ConflictNotWrappedAsHandlerFailure) {
    auto registry = std::make_shared<events::EventHandlerRegistry>();
    registry->subscribe(events::contracts::USER_DELETED,
        std::make_shared<events::EventHandlerFunc>([](const Context&, const events::DomainEvent&) {
            translateConflicts([] { throw pqxx::deadlock_detected("deadlock detected"); });
        }));
    events::TransactionalEventBus bus(registry, 10);

    bus.publish(Context::background(), std::make_shared<events::contracts::UserDeletedEvent>("user-1"));

    EXPECT_THROW(bus.flush(Context::background()), transaction::TransactionAbortedException);
}
