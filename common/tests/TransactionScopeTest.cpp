/**
 * @file TransactionScopeTest.cpp
 * @brief Тесты границ транзакций и их взаимодействия с TransactionalEventBus
 */

#include <gtest/gtest.h>
#include "transaction/ReadWriteTransactionScope.hpp"
#include "transaction/ReadOnlyTransactionScope.hpp"
#include "storage/InMemoryDatabase.hpp"
#include "events/TransactionalEventBus.hpp"
#include "events/EventHandlerRegistry.hpp"
#include "events/EventExceptions.hpp"
#include "mocks/TestEvents.hpp"

using namespace monolith;
using namespace monolith::transaction;
using namespace monolith::tests;

namespace {

const std::string ACCOUNTS = "accounts";

void writeBalance(const Context& ctx, const std::string& id, int balance) {
    auto tx = readWriteTxFromContext(ctx);
    ASSERT_NE(tx, nullptr);
    tx->bufferWrite({storage::Mutation::insertOrUpdate(ACCOUNTS, id, {{"id", id}, {"balance", balance}})});
}

} // namespace

// ============================================================================
// TEST FIXTURE
// ============================================================================

class TransactionScopeTest : public ::testing::Test {
protected:
    void SetUp() override {
        database_ = std::make_shared<storage::InMemoryDatabase>(3);
        registry_ = std::make_shared<events::EventHandlerRegistry>();
        readWriteScope_ = std::make_shared<ReadWriteTransactionScope>(database_);
        readOnlyScope_ = std::make_shared<ReadOnlyTransactionScope>(database_);
    }

    std::optional<storage::Row> committedRow(const std::string& id) {
        auto tx = database_->beginReadOnly();
        storage::ReadOnlyTransactionGuard guard(tx);
        return tx->readRow(ACCOUNTS, id);
    }

    std::shared_ptr<storage::InMemoryDatabase> database_;
    std::shared_ptr<events::EventHandlerRegistry> registry_;
    std::shared_ptr<ReadWriteTransactionScope> readWriteScope_;
    std::shared_ptr<ReadOnlyTransactionScope> readOnlyScope_;
};

// ============================================================================
// READ-WRITE SCOPE
// ============================================================================

TEST_F(TransactionScopeTest, ReadWrite_Success_Commits) {
    readWriteScope_->execute(Context::background(), [](const Context& ctx) {
        writeBalance(ctx, "acc-1", 100);
    });

    auto row = committedRow("acc-1");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ((*row)["balance"], 100);
}

TEST_F(TransactionScopeTest, ReadWrite_Error_RollsBackAndPropagates) {
    EXPECT_THROW(
        readWriteScope_->execute(Context::background(), [](const Context& ctx) {
            writeBalance(ctx, "acc-1", 100);
            throw std::runtime_error("business failure");
        }),
        std::runtime_error);

    EXPECT_FALSE(committedRow("acc-1").has_value());
    EXPECT_EQ(database_->commitCount(), 0u);
}

TEST_F(TransactionScopeTest, ReadWrite_ReadsSeeOwnWrites) {
    readWriteScope_->execute(Context::background(), [](const Context& ctx) {
        writeBalance(ctx, "acc-1", 42);

        auto reader = readCapabilityFromContext(ctx);
        ASSERT_NE(reader, nullptr);
        auto row = reader->readRow(ACCOUNTS, "acc-1");
        ASSERT_TRUE(row.has_value());
        EXPECT_EQ((*row)["balance"], 42);
        EXPECT_EQ(reader->query(ACCOUNTS, "balance", 42).size(), 1u);
    });
}

TEST_F(TransactionScopeTest, ReadWrite_NestedExecute_Rejected) {
    bool innerRan = false;

    EXPECT_THROW(
        readWriteScope_->execute(Context::background(), [&](const Context& ctx) {
            readWriteScope_->execute(ctx, [&](const Context&) { innerRan = true; });
        }),
        NestedTransactionException);

    EXPECT_FALSE(innerRan);
}

TEST_F(TransactionScopeTest, ReadWrite_InsideReadOnly_Rejected) {
    EXPECT_THROW(
        readOnlyScope_->execute(Context::background(), [&](const Context& ctx) {
            readWriteScope_->execute(ctx, [](const Context&) {});
        }),
        NestedTransactionException);
}

TEST_F(TransactionScopeTest, ReadWrite_CancelledContext_DoesNotRun) {
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    bool ran = false;

    EXPECT_THROW(
        readWriteScope_->execute(Context::background().withCancellation(token),
                                 [&](const Context&) { ran = true; }),
        OperationCancelledException);

    EXPECT_FALSE(ran);
}

// ============================================================================
// RETRY
// ============================================================================

TEST_F(TransactionScopeTest, ReadWrite_AbortedAttempt_RetriedWithFreshState) {
    int attempts = 0;
    std::vector<size_t> pendingAtStart;
    registry_->subscribe(PING_SENT, std::make_shared<events::EventHandlerFunc>(
        [](const Context& ctx, const events::DomainEvent&) { writeBalance(ctx, "acc-1", 7); }));

    readWriteScope_->execute(Context::background(), [&](const Context& ctx) {
        ++attempts;
        events::TransactionalEventBus eventBus(registry_);
        pendingAtStart.push_back(eventBus.pendingCount());

        eventBus.publish(ctx, makeEvent(PING_SENT));
        if (attempts == 1) {
            throw TransactionAbortedException("simulated conflict");
        }
        eventBus.flush(ctx);
    });

    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(pendingAtStart, (std::vector<size_t>{0, 0}));
    EXPECT_EQ((*committedRow("acc-1"))["balance"], 7);
}

TEST_F(TransactionScopeTest, ReadWrite_ConcurrentWrite_CausesRetry) {
    database_->apply({storage::Mutation::insertOrUpdate(ACCOUNTS, "acc-1", {{"id", "acc-1"}, {"balance", 10}})});
    int attempts = 0;

    readWriteScope_->execute(Context::background(), [&](const Context& ctx) {
        ++attempts;
        auto row = readCapabilityFromContext(ctx)->readRow(ACCOUNTS, "acc-1");
        int balance = (*row)["balance"].get<int>();

        if (attempts == 1) {
            // Другая транзакция успела изменить строку
            database_->apply({storage::Mutation::insertOrUpdate(ACCOUNTS, "acc-1", {{"id", "acc-1"}, {"balance", 50}})});
        }
        writeBalance(ctx, "acc-1", balance + 1);
    });

    EXPECT_EQ(attempts, 2);
    EXPECT_EQ((*committedRow("acc-1"))["balance"], 51);
}

TEST_F(TransactionScopeTest, ReadWrite_RetriesExhausted_Throws) {
    int attempts = 0;

    EXPECT_THROW(
        readWriteScope_->execute(Context::background(), [&](const Context&) {
            ++attempts;
            throw TransactionAbortedException("always conflicts");
        }),
        TransactionAbortedException);

    EXPECT_EQ(attempts, database_->getMaxAttempts());
}

// ============================================================================
// EVENT HANDLER FAILURE ROLLS BACK THE COMMAND
// ============================================================================

TEST_F(TransactionScopeTest, HandlerError_RollsBackCommandWrites) {
    registry_->subscribe(PING_SENT, std::make_shared<events::EventHandlerFunc>(
        [](const Context& ctx, const events::DomainEvent&) {
            writeBalance(ctx, "acc-2", 1);
            throw std::runtime_error("downstream rule violated");
        }));

    EXPECT_THROW(
        readWriteScope_->execute(Context::background(), [&](const Context& ctx) {
            events::TransactionalEventBus eventBus(registry_);
            writeBalance(ctx, "acc-1", 100);
            eventBus.publish(ctx, makeEvent(PING_SENT));
            eventBus.flush(ctx);
        }),
        events::EventHandlerException);

    EXPECT_FALSE(committedRow("acc-1").has_value());
    EXPECT_FALSE(committedRow("acc-2").has_value());
}

TEST_F(TransactionScopeTest, HandlerWrites_CommitTogetherWithCommand) {
    registry_->subscribe(PING_SENT, std::make_shared<events::EventHandlerFunc>(
        [](const Context& ctx, const events::DomainEvent&) { writeBalance(ctx, "acc-2", 5); }));

    readWriteScope_->execute(Context::background(), [&](const Context& ctx) {
        events::TransactionalEventBus eventBus(registry_);
        writeBalance(ctx, "acc-1", 100);
        eventBus.publish(ctx, makeEvent(PING_SENT));
        eventBus.flush(ctx);
    });

    EXPECT_TRUE(committedRow("acc-1").has_value());
    EXPECT_TRUE(committedRow("acc-2").has_value());
    EXPECT_EQ(database_->commitCount(), 1u);
}

// ============================================================================
// READ-ONLY SCOPE
// ============================================================================

TEST_F(TransactionScopeTest, ReadOnly_ProvidesSnapshotAndCloses) {
    database_->apply({storage::Mutation::insertOrUpdate(ACCOUNTS, "acc-1", {{"id", "acc-1"}, {"balance", 3}})});

    readOnlyScope_->execute(Context::background(), [&](const Context& ctx) {
        EXPECT_EQ(readWriteTxFromContext(ctx), nullptr);
        auto reader = readCapabilityFromContext(ctx);
        ASSERT_NE(reader, nullptr);

        database_->apply({storage::Mutation::insertOrUpdate(ACCOUNTS, "acc-1", {{"id", "acc-1"}, {"balance", 4}})});

        EXPECT_EQ((*reader->readRow(ACCOUNTS, "acc-1"))["balance"], 3);
        EXPECT_EQ(database_->openReadOnlyCount(), 1);
    });

    EXPECT_EQ(database_->openReadOnlyCount(), 0);
}

TEST_F(TransactionScopeTest, ReadOnly_ClosesOnError) {
    EXPECT_THROW(
        readOnlyScope_->execute(Context::background(), [](const Context&) {
            throw std::runtime_error("query failed");
        }),
        std::runtime_error);

    EXPECT_EQ(database_->openReadOnlyCount(), 0);
}

TEST_F(TransactionScopeTest, ReadOnly_Nested_Rejected) {
    EXPECT_THROW(
        readOnlyScope_->execute(Context::background(), [&](const Context& ctx) {
            readOnlyScope_->execute(ctx, [](const Context&) {});
        }),
        NestedTransactionException);

    EXPECT_EQ(database_->openReadOnlyCount(), 0);
}

// ============================================================================
// EXECUTE WITH RESULT
// ============================================================================

TEST_F(TransactionScopeTest, ExecuteWithResult_ReturnsValue) {
    auto id = executeWithResult<std::string>(*readWriteScope_, Context::background(),
        [](const Context& ctx) {
            writeBalance(ctx, "acc-9", 1);
            return std::string("acc-9");
        });

    EXPECT_EQ(id, "acc-9");
    EXPECT_TRUE(committedRow("acc-9").has_value());
}

TEST_F(TransactionScopeTest, ExecuteWithResult_FnError_Propagates) {
    EXPECT_THROW(
        executeWithResult<int>(*readWriteScope_, Context::background(),
            [](const Context&) -> int { throw std::runtime_error("fn failed"); }),
        std::runtime_error);
}

TEST_F(TransactionScopeTest, ExecuteWithResult_ReturnsLastAttemptValue) {
    int attempts = 0;

    auto value = executeWithResult<int>(*readWriteScope_, Context::background(),
        [&](const Context&) {
            ++attempts;
            if (attempts == 1) {
                throw TransactionAbortedException("retry me");
            }
            return attempts * 10;
        });

    EXPECT_EQ(value, 20);
}

TEST_F(TransactionScopeTest, ExecuteWithResult_StructResult) {
    struct Summary {
        std::string id;
        int balance;
    };
    database_->apply({storage::Mutation::insertOrUpdate(ACCOUNTS, "acc-1", {{"id", "acc-1"}, {"balance", 77}})});

    auto summary = executeWithResult<Summary>(*readOnlyScope_, Context::background(),
        [](const Context& ctx) {
            auto row = readCapabilityFromContext(ctx)->readRow(ACCOUNTS, "acc-1");
            return Summary{(*row)["id"].get<std::string>(), (*row)["balance"].get<int>()};
        });

    EXPECT_EQ(summary.id, "acc-1");
    EXPECT_EQ(summary.balance, 77);
}
