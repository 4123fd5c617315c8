/**
 * @file UserDeletionCascadeTest.cpp
 * @brief Удаление пользователя отменяет его открытые заказы в той же транзакции
 */

#include <gtest/gtest.h>
#include "mocks/TestModules.hpp"
#include "events/EventExceptions.hpp"
#include "orders/domain/events/OrderEvents.hpp"
#include <algorithm>

using namespace monolith;
using namespace monolith::tests;
using orders::domain::OrderStatus;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class UserDeletionCascadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        userId_ = modules_.userService->createUser(modules_.ctx(), "owner@example.com", "Maria", "Orlova");
        firstOrder_ = modules_.createPendingOrder(userId_, "sku-1");
        secondOrder_ = modules_.createPendingOrder(userId_, "sku-2");
    }

    OrderStatus statusOf(const std::string& orderId) {
        return modules_.orderService->getOrder(modules_.ctx(), orderId).status();
    }

    users::domain::UserStatus userStatus() {
        return modules_.userService->getUser(modules_.ctx(), userId_).status();
    }

    TestModules modules_;
    std::string userId_;
    std::string firstOrder_;
    std::string secondOrder_;
};

// ============================================================================
// SCENARIO
// ============================================================================

TEST_F(UserDeletionCascadeTest, DeleteUser_CancelsPendingOrdersAtomically) {
    modules_.userService->deleteUser(modules_.ctx(), userId_);

    EXPECT_EQ(userStatus(), users::domain::UserStatus::DELETED);
    EXPECT_EQ(statusOf(firstOrder_), OrderStatus::CANCELLED);
    EXPECT_EQ(statusOf(secondOrder_), OrderStatus::CANCELLED);
}

TEST_F(UserDeletionCascadeTest, FailingSecondOrderSave_RollsEverythingBack) {
    modules_.orderRepository->failOnSave(2);

    EXPECT_THROW(modules_.userService->deleteUser(modules_.ctx(), userId_), events::EventHandlerException);

    EXPECT_EQ(userStatus(), users::domain::UserStatus::ACTIVE);
    EXPECT_EQ(statusOf(firstOrder_), OrderStatus::PENDING);
    EXPECT_EQ(statusOf(secondOrder_), OrderStatus::PENDING);
}

TEST_F(UserDeletionCascadeTest, HandlerFailure_PreservesOriginalCause) {
    modules_.orderRepository->failOnSave(1);

    try {
        modules_.userService->deleteUser(modules_.ctx(), userId_);
        FAIL() << "expected EventHandlerException";
    } catch (const events::EventHandlerException& e) {
        EXPECT_EQ(e.getEventType(), events::contracts::USER_DELETED.str());
        EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
    }
}

TEST_F(UserDeletionCascadeTest, AlreadyCancelledOrderIsSkippedAndDraftIsCancelled) {
    modules_.orderService->cancelOrder(modules_.ctx(), secondOrder_);
    auto draft = modules_.orderService->createOrder(modules_.ctx(), userId_);

    modules_.userService->deleteUser(modules_.ctx(), userId_);

    EXPECT_EQ(statusOf(firstOrder_), OrderStatus::CANCELLED);
    EXPECT_EQ(statusOf(secondOrder_), OrderStatus::CANCELLED);
    EXPECT_EQ(statusOf(draft), OrderStatus::CANCELLED);
}

TEST_F(UserDeletionCascadeTest, OrderCancelledEventsFlowThroughSameFlush) {
    std::vector<std::string> cancelled;
    events::subscribeTyped<orders::domain::OrderCancelledEvent>(*modules_.registry,
        events::contracts::ORDER_CANCELLED,
        [&](const Context& ctx, const orders::domain::OrderCancelledEvent& event) {
            EXPECT_TRUE(transaction::readWriteTxFromContext(ctx) != nullptr);
            cancelled.push_back(event.orderId());
        });

    modules_.userService->deleteUser(modules_.ctx(), userId_);

    ASSERT_EQ(cancelled.size(), 2u);
    EXPECT_NE(std::find(cancelled.begin(), cancelled.end(), firstOrder_), cancelled.end());
    EXPECT_NE(std::find(cancelled.begin(), cancelled.end(), secondOrder_), cancelled.end());
}

TEST_F(UserDeletionCascadeTest, OrdersOfOtherUsersAreUntouched) {
    auto otherUser = modules_.userService->createUser(modules_.ctx(), "other@example.com", "Petr", "Petrov");
    auto otherOrder = modules_.createPendingOrder(otherUser);

    modules_.userService->deleteUser(modules_.ctx(), userId_);

    EXPECT_EQ(statusOf(otherOrder), OrderStatus::PENDING);
}
